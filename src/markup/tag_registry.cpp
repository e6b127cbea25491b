#include <tagtext/markup/tag_registry.h>
#include <tagtext/markup/builtin_effects.h>
#include <tagtext/core/config.h>
#include <cctype>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

namespace {

std::string to_lower_ascii(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

std::string join_from(const std::vector<std::string>& args, size_t first) {
    std::string joined;
    for (size_t i = first; i < args.size(); ++i) {
        if (i > first) joined += cfg::kParamSeparator;
        joined += args[i];
    }
    return joined;
}

const char* const kNamedColorTags[] = {
    "black", "dark_blue", "dark_green", "dark_aqua", "dark_red", "dark_purple",
    "gold", "gray", "grey", "dark_gray", "dark_grey", "blue", "green", "aqua",
    "red", "light_purple", "yellow", "white",
};

struct DecorationTag {
    text::Decoration decoration;
    std::vector<std::string> names;
};

void register_colors(TagRegistry& registry) {
    for (const char* name : kNamedColorTags) {
        registry.register_tag(name, [](const std::string& tag, const std::vector<std::string>&,
                                       const ResolveContext&) -> EffectPtr {
            auto color = text::TextColor::named(tag);
            if (!color) return nullptr;
            return std::make_unique<ColorEffect>(tag, *color);
        });
    }

    registry.register_tag({"color", "colour", "c"},
        [](const std::string& tag, const std::vector<std::string>& args,
           const ResolveContext&) -> EffectPtr {
            if (args.size() != 1) return nullptr;
            auto color = text::TextColor::parse(args[0]);
            if (!color) return nullptr;
            return std::make_unique<ColorEffect>(tag, *color);
        });

    registry.register_matcher(
        [](std::string_view name) { return text::TextColor::from_hex(name).has_value(); },
        [](const std::string& tag, const std::vector<std::string>&,
           const ResolveContext&) -> EffectPtr {
            auto color = text::TextColor::from_hex(tag);
            if (!color) return nullptr;
            return std::make_unique<ColorEffect>(tag, *color);
        });
}

void register_decorations(TagRegistry& registry) {
    const DecorationTag decorations[] = {
        {text::Decoration::Bold,          {"bold", "b"}},
        {text::Decoration::Italic,        {"italic", "i", "em"}},
        {text::Decoration::Underlined,    {"underlined", "u"}},
        {text::Decoration::Strikethrough, {"strikethrough", "st"}},
        {text::Decoration::Obfuscated,    {"obfuscated", "obf"}},
    };

    for (const auto& entry : decorations) {
        text::Decoration decoration = entry.decoration;
        for (const std::string& name : entry.names) {
            registry.register_tag(name, [decoration](const std::string& tag, const std::vector<std::string>&,
                                                     const ResolveContext&) -> EffectPtr {
                return std::make_unique<DecorationEffect>(tag, decoration, true);
            });
            registry.register_tag("!" + name,
                [decoration](const std::string& tag, const std::vector<std::string>&,
                             const ResolveContext&) -> EffectPtr {
                    return std::make_unique<DecorationEffect>(tag, decoration, false);
                });
        }
    }
}

void register_events(TagRegistry& registry) {
    registry.register_tag("click", [](const std::string& tag, const std::vector<std::string>& args,
                                      const ResolveContext&) -> EffectPtr {
        if (args.size() < 2) return nullptr;
        auto action = text::ClickEvent::action_from_name(to_lower_ascii(args[0]));
        if (!action) return nullptr;
        text::ClickEvent event;
        event.action = *action;
        event.value = join_from(args, 1);
        return std::make_unique<ClickEffect>(tag, std::move(event));
    });

    registry.register_tag("hover", [](const std::string& tag, const std::vector<std::string>& args,
                                      const ResolveContext& context) -> EffectPtr {
        if (args.size() < 2 || to_lower_ascii(args[0]) != "show_text") return nullptr;
        std::string value = join_from(args, 1);
        text::Component hover = context.parse_nested ? context.parse_nested(value)
                                                     : text::Component::text(value);
        return std::make_unique<HoverEffect>(tag, std::move(hover));
    });

    registry.register_tag({"insert", "insertion"},
        [](const std::string& tag, const std::vector<std::string>& args,
           const ResolveContext&) -> EffectPtr {
            if (args.empty()) return nullptr;
            return std::make_unique<InsertionEffect>(tag, join_from(args, 0));
        });

    registry.register_tag("font", [](const std::string& tag, const std::vector<std::string>& args,
                                     const ResolveContext&) -> EffectPtr {
        if (args.empty() || args[0].empty()) return nullptr;
        return std::make_unique<FontEffect>(tag, join_from(args, 0));
    });
}

void register_structural(TagRegistry& registry) {
    registry.register_tag("reset", [](const std::string& tag, const std::vector<std::string>&,
                                      const ResolveContext&) -> EffectPtr {
        return std::make_unique<ResetEffect>(tag);
    });
    registry.register_tag({"newline", "br"},
        [](const std::string& tag, const std::vector<std::string>&,
           const ResolveContext&) -> EffectPtr {
            return std::make_unique<NewlineEffect>(tag);
        });
    registry.register_tag("capitalize", [](const std::string& tag, const std::vector<std::string>&,
                                           const ResolveContext&) -> EffectPtr {
        return std::make_unique<CapitalizeEffect>(tag);
    });
    registry.register_tag(std::string(cfg::kRawTagName),
        [](const std::string& tag, const std::vector<std::string>&,
           const ResolveContext&) -> EffectPtr {
            return std::make_unique<PreEffect>(tag);
        });
}

} // namespace

std::string unquote(std::string_view text) {
    if (text.size() < 2) return std::string(text);
    char quote = text.front();
    if ((quote != '\'' && quote != '"') || text.back() != quote) {
        return std::string(text);
    }

    std::string_view body = text.substr(1, text.size() - 2);
    std::string result;
    result.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == cfg::kEscapeMarker && i + 1 < body.size() && body[i + 1] == quote) {
            continue;
        }
        result += body[i];
    }
    return result;
}

std::vector<std::string> split_arguments(const TokenList& params) {
    std::vector<std::string> args;
    if (params.empty()) return args;

    std::string current;
    for (const auto& token : params) {
        if (token.type == TokenType::ParamSeparator) {
            args.push_back(std::move(current));
            current.clear();
        } else {
            current += unquote(token.text);
        }
    }
    args.push_back(std::move(current));
    return args;
}

TagRegistry TagRegistry::standard() {
    TagRegistry registry;
    register_colors(registry);
    register_decorations(registry);
    register_events(registry);
    register_structural(registry);
    return registry;
}

std::shared_ptr<const TagRegistry> TagRegistry::shared_standard() {
    static const std::shared_ptr<const TagRegistry> instance =
        std::make_shared<const TagRegistry>(standard());
    return instance;
}

void TagRegistry::register_tag(const std::string& name, TagFactory factory) {
    tags_.insert_or_assign(to_lower_ascii(name), std::move(factory));
}

void TagRegistry::register_tag(std::initializer_list<std::string> names, const TagFactory& factory) {
    for (const auto& name : names) {
        register_tag(name, factory);
    }
}

void TagRegistry::register_matcher(NamePredicate predicate, TagFactory factory) {
    matchers_.emplace_back(std::move(predicate), std::move(factory));
}

const TagFactory* TagRegistry::find_factory(const std::string& lowered) const {
    auto it = tags_.find(lowered);
    if (it != tags_.end()) {
        return &it->second;
    }
    for (const auto& [predicate, factory] : matchers_) {
        if (predicate(lowered)) {
            return &factory;
        }
    }
    return nullptr;
}

bool TagRegistry::exists(std::string_view name) const {
    return find_factory(to_lower_ascii(name)) != nullptr;
}

EffectPtr TagRegistry::resolve(std::string_view name, const TokenList& params,
                               const ResolveContext& context) const {
    std::string lowered = to_lower_ascii(name);

    if (context.templates) {
        auto it = context.templates->find(name);
        if (it != context.templates->end()) {
            return std::make_unique<TemplateEffect>(lowered, it->second);
        }
    }

    if (const TagFactory* factory = find_factory(lowered)) {
        return (*factory)(lowered, split_arguments(params), context);
    }

    if (context.placeholder_resolver && *context.placeholder_resolver) {
        if (auto value = (*context.placeholder_resolver)(std::string(name))) {
            return std::make_unique<TemplateEffect>(lowered, std::move(*value));
        }
    }
    return nullptr;
}

} // namespace tagtext::markup
