#include <tagtext/markup/template.h>
#include <tagtext/markup/errors.h>
#include <tagtext/core/config.h>

namespace tagtext::markup {

namespace cfg = tagtext::core::config;

Template Template::of(std::string key, std::string value) {
    return Template(std::move(key), std::move(value));
}

Template Template::of(std::string key, const char* value) {
    return Template(std::move(key), std::string(value ? value : ""));
}

Template Template::of(std::string key, text::Component value) {
    return Template(std::move(key), std::move(value));
}

std::string replace_placeholders(std::string_view text, const std::vector<Replacement>& replacements) {
    if (replacements.empty()) return std::string(text);

    std::vector<std::string> patterns;
    patterns.reserve(replacements.size());
    for (const auto& [key, value] : replacements) {
        std::string pattern;
        pattern += cfg::kTagStart;
        pattern += key;
        pattern += cfg::kTagEnd;
        patterns.push_back(std::move(pattern));
    }

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        if (text[i] == cfg::kTagStart) {
            for (size_t p = 0; p < patterns.size(); ++p) {
                const std::string& pattern = patterns[p];
                if (text.compare(i, pattern.size(), pattern) == 0) {
                    result += replacements[p].second;
                    i += pattern.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            result += text[i];
            ++i;
        }
    }
    return result;
}

std::string replace_placeholders_flat(std::string_view text, const std::vector<std::string>& key_values) {
    if (key_values.size() % 2 != 0) {
        throw PlaceholderError(
            "Invalid number of placeholders (" + std::to_string(key_values.size()) +
            "), expected alternating key, value pairs");
    }

    std::vector<Replacement> replacements;
    replacements.reserve(key_values.size() / 2);
    for (size_t i = 0; i < key_values.size(); i += 2) {
        replacements.emplace_back(key_values[i], key_values[i + 1]);
    }
    return replace_placeholders(text, replacements);
}

std::string replace_placeholders(std::string_view text, const std::map<std::string, std::string>& values) {
    std::vector<Replacement> replacements(values.begin(), values.end());
    return replace_placeholders(text, replacements);
}

TemplateSubstitution apply_templates(std::string_view text, const std::vector<Template>& templates) {
    TemplateSubstitution result;
    std::vector<Replacement> replacements;
    for (const auto& tmpl : templates) {
        if (tmpl.is_string()) {
            replacements.emplace_back(tmpl.key(), tmpl.string_value());
        } else {
            result.components.insert_or_assign(tmpl.key(), tmpl.component_value());
        }
    }
    result.text = replace_placeholders(text, replacements);
    return result;
}

} // namespace tagtext::markup
