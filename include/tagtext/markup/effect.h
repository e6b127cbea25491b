#pragma once
#include <tagtext/text/component.h>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagtext::markup {

enum class Capability : uint8_t {
    None = 0,
    Persistent = 1 << 0,     // stays in the active scope until closed
    InstantApply = 1 << 1,   // runs once when the open tag is read
    OneShot = 1 << 2,        // consumed by the next content node
    Inserting = 1 << 3,      // applied once more at end of stream while still open
    RawModeMarker = 1 << 4,  // suspends tag interpretation until closed
};

inline Capability operator|(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline Capability operator&(Capability a, Capability b) {
    return static_cast<Capability>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

class EffectScope;

// Behavior bound to a resolved tag. Capabilities are fixed at construction so
// the interpreter dispatches on them without inspecting concrete types. Effects
// receive the root builder for the duration of a call and must not keep it.
class Effect {
public:
    Effect(std::string name, Capability capabilities);
    virtual ~Effect();

    Effect(const Effect&) = delete;
    Effect& operator=(const Effect&) = delete;

    // Tag name used to open the effect, lowercase; close tags match on it.
    const std::string& name() const { return name_; }
    Capability capabilities() const { return capabilities_; }
    bool has(Capability capability) const {
        return (capabilities_ & capability) != Capability::None;
    }

    // Styles one content node. Returning nullopt drops the node.
    virtual std::optional<text::Component> apply(text::Component current, text::ComponentBuilder& parent);

    virtual void apply_instant(text::ComponentBuilder& parent, EffectScope& scope);

    // Defaults to apply(); may open further scope entries or queue one-shots.
    virtual std::optional<text::Component> apply_once(text::Component current,
                                                      text::ComponentBuilder& parent,
                                                      EffectScope& scope);

    // Value identity such as "color(#ff5555)". Effects with equal signatures are equal.
    virtual std::string signature() const;
    bool equals(const Effect& other) const { return signature() == other.signature(); }

private:
    std::string name_;
    Capability capabilities_;
};

using EffectPtr = std::unique_ptr<Effect>;

// Open effects of one parse, in opening order, plus the queue of pending
// one-shot effects.
class EffectScope {
public:
    void open(EffectPtr effect);

    // Most recently opened entry with this name; entries opened after it stay open.
    EffectPtr remove_last_named(std::string_view name);
    // Oldest entry equal to `effect`.
    EffectPtr remove_first_equal(const Effect& effect);
    void clear();

    size_t active_count() const { return active_.size(); }
    const std::vector<EffectPtr>& active() const { return active_; }

    template<typename Fn>
    void for_each_active(Fn&& fn) {
        for (auto& effect : active_) {
            fn(*effect);
        }
    }

    void enqueue_once(EffectPtr effect);
    EffectPtr take_newest_once();
    EffectPtr take_oldest_once();
    bool has_pending_once() const { return !once_.empty(); }
    size_t pending_once_count() const { return once_.size(); }

private:
    std::vector<EffectPtr> active_;
    std::deque<EffectPtr> once_;
};

} // namespace tagtext::markup
