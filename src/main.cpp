#include <tagtext/core/config.h>
#include <tagtext/core/diagnostics.h>
#include <tagtext/markup/errors.h>
#include <tagtext/markup/markup.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace cfg = tagtext::core::config;

enum class OutputMode {
  Tree,
  Plain,
  Escape,
  Strip,
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << cfg::kProgramName
         << " [--strict] [--escape|--strip|--plain] [-p key=value]... <markup>\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool parse_placeholder(std::string_view text, std::vector<std::string>& key_values) {
  const std::size_t separator = text.find('=');
  if (separator == std::string_view::npos || separator == 0) {
    return false;
  }

  key_values.emplace_back(text.substr(0, separator));
  key_values.emplace_back(text.substr(separator + 1));
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && argv[1] != nullptr && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && argv[1] != nullptr && is_version_flag(argv[1])) {
    std::cout << cfg::kVersionString << "\n";
    return 0;
  }

  bool strict = false;
  bool has_mode_flag = false;
  OutputMode mode = OutputMode::Tree;
  std::vector<std::string> placeholders;
  std::vector<std::string> positional_args;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");

    if (argument == "--strict") {
      strict = true;
      continue;
    }
    if (argument == "--escape" || argument == "--strip" || argument == "--plain") {
      if (has_mode_flag) {
        std::cerr << "Only one of --escape, --strip and --plain may be given\n";
        print_usage(std::cerr);
        return 1;
      }
      mode = argument == "--escape" ? OutputMode::Escape
             : argument == "--strip" ? OutputMode::Strip
                                     : OutputMode::Plain;
      has_mode_flag = true;
      continue;
    }
    if (argument == "-p") {
      if (index + 1 >= argc || argv[index + 1] == nullptr ||
          !parse_placeholder(argv[index + 1], placeholders)) {
        std::cerr << "Invalid -p: expected key=value\n";
        print_usage(std::cerr);
        return 1;
      }
      ++index;
      continue;
    }

    positional_args.emplace_back(argument);
  }

  if (positional_args.size() != 1) {
    print_usage(std::cerr);
    return 1;
  }
  const std::string& input = positional_args.front();

  tagtext::markup::Markup markup = tagtext::markup::Markup::builder()
      .strict(strict)
      .min_severity(tagtext::core::Severity::Warning)
      .add_observer([](const tagtext::core::DiagnosticEvent& event) {
        std::cerr << tagtext::core::format_diagnostic(event) << "\n";
      })
      .build();

  if (mode == OutputMode::Escape) {
    std::cout << markup.escape_tags(input) << "\n";
    return 0;
  }
  if (mode == OutputMode::Strip) {
    std::cout << markup.strip_tags(input) << "\n";
    return 0;
  }

  try {
    const tagtext::text::Component component = markup.parse(input, placeholders);
    if (mode == OutputMode::Plain) {
      std::cout << component.plain_text() << "\n";
    } else {
      std::cout << component.to_debug_string() << "\n";
    }
  } catch (const tagtext::markup::ParsingError& error) {
    std::cerr << "Parse error";
    if (error.position() >= 0) {
      std::cerr << " at " << error.position();
    }
    std::cerr << ": " << error.what() << "\n";
    return 1;
  } catch (const tagtext::markup::PlaceholderError& error) {
    std::cerr << "Invalid placeholders: " << error.what() << "\n";
    return 1;
  }
  return 0;
}
