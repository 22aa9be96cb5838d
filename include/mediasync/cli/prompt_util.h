/**
 * Prompt helpers for interactive CLI workflows (std::cout/std::cin).
 */
#pragma once
#include <iostream>
#include <string>

namespace mediasync::cli {

struct YesNoOptions {
    bool defaultYes{false};     // Returned on empty input, unknown input and EOF
    std::string yesChars{"yY"}; // Acceptable yes characters
    std::string noChars{"nN"};  // Acceptable no characters
};

inline bool prompt_yes_no(const std::string& prompt, std::istream& in, std::ostream& out,
                          const YesNoOptions& opts = {}) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << "\n";
        return opts.defaultYes; // EOF -> default
    }
    if (line.empty())
        return opts.defaultYes;
    char c = line[0];
    if (opts.yesChars.find(c) != std::string::npos)
        return true;
    if (opts.noChars.find(c) != std::string::npos)
        return false;
    return opts.defaultYes;
}

inline bool prompt_yes_no(const std::string& prompt, const YesNoOptions& opts = {}) {
    return prompt_yes_no(prompt, std::cin, std::cout, opts);
}

} // namespace mediasync::cli
