#include <tagtext/markup/effect.h>
#include <algorithm>

namespace tagtext::markup {

Effect::Effect(std::string name, Capability capabilities)
    : name_(std::move(name)), capabilities_(capabilities) {}

Effect::~Effect() = default;

std::optional<text::Component> Effect::apply(text::Component current, text::ComponentBuilder&) {
    return current;
}

void Effect::apply_instant(text::ComponentBuilder&, EffectScope&) {}

std::optional<text::Component> Effect::apply_once(text::Component current,
                                                  text::ComponentBuilder& parent,
                                                  EffectScope&) {
    return apply(std::move(current), parent);
}

std::string Effect::signature() const {
    return name_;
}

void EffectScope::open(EffectPtr effect) {
    active_.push_back(std::move(effect));
}

EffectPtr EffectScope::remove_last_named(std::string_view name) {
    for (auto it = active_.rbegin(); it != active_.rend(); ++it) {
        if ((*it)->name() == name) {
            EffectPtr removed = std::move(*it);
            active_.erase(std::next(it).base());
            return removed;
        }
    }
    return nullptr;
}

EffectPtr EffectScope::remove_first_equal(const Effect& effect) {
    auto it = std::find_if(active_.begin(), active_.end(),
        [&effect](const EffectPtr& e) { return e->equals(effect); });
    if (it == active_.end()) {
        return nullptr;
    }
    EffectPtr removed = std::move(*it);
    active_.erase(it);
    return removed;
}

void EffectScope::clear() {
    active_.clear();
}

void EffectScope::enqueue_once(EffectPtr effect) {
    once_.push_back(std::move(effect));
}

EffectPtr EffectScope::take_newest_once() {
    if (once_.empty()) return nullptr;
    EffectPtr effect = std::move(once_.back());
    once_.pop_back();
    return effect;
}

EffectPtr EffectScope::take_oldest_once() {
    if (once_.empty()) return nullptr;
    EffectPtr effect = std::move(once_.front());
    once_.pop_front();
    return effect;
}

} // namespace tagtext::markup
