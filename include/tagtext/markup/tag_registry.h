#pragma once
#include <tagtext/markup/effect.h>
#include <tagtext/markup/template.h>
#include <tagtext/markup/token.h>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagtext::markup {

// Per-parse inputs a tag factory may consult. All members are borrowed for the
// duration of one resolve call.
struct ResolveContext {
    const ComponentTemplateMap* templates = nullptr;
    const PlaceholderResolver* placeholder_resolver = nullptr;
    // Parses argument text (hover text) with the settings of the running parse.
    std::function<text::Component(const std::string&)> parse_nested;
};

// Arguments as the factories see them: split on separators, quotes removed.
std::vector<std::string> split_arguments(const TokenList& params);

// Removes matching surrounding quotes and the escape marker before an escaped quote.
std::string unquote(std::string_view text);

using TagFactory = std::function<EffectPtr(const std::string& name,
                                           const std::vector<std::string>& args,
                                           const ResolveContext& context)>;
using NamePredicate = std::function<bool(std::string_view name)>;

// Maps tag names to effect factories. Names are case-insensitive. Immutable once
// shared: resolve() and exists() are safe from concurrent parses.
class TagRegistry {
public:
    TagRegistry() = default;

    // Built-in catalog: colors, decorations, click, hover, insert, font, reset,
    // newline, capitalize, pre.
    static TagRegistry standard();
    static std::shared_ptr<const TagRegistry> shared_standard();

    void register_tag(const std::string& name, TagFactory factory);
    void register_tag(std::initializer_list<std::string> names, const TagFactory& factory);
    // Fallback for name families such as "#rrggbb"; consulted after exact names.
    void register_matcher(NamePredicate predicate, TagFactory factory);

    bool exists(std::string_view name) const;

    // Component templates first, then registered tags, then the placeholder
    // resolver. Returns nullptr when nothing accepts the name and arguments.
    EffectPtr resolve(std::string_view name, const TokenList& params, const ResolveContext& context) const;

    size_t size() const { return tags_.size(); }

private:
    std::map<std::string, TagFactory, std::less<>> tags_;
    std::vector<std::pair<NamePredicate, TagFactory>> matchers_;

    const TagFactory* find_factory(const std::string& lowered) const;
};

} // namespace tagtext::markup
