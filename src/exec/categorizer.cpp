/*
 * Command categorizer implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/categorizer.hpp>
#include <devdeck/lex/lexer.hpp>
#include <array>
#include <cctype>

namespace devdeck {

namespace {

struct KeywordGroup {
    Category category;
    std::array<std::string_view, 8> words;
};

// Checked in order; the first group with any hit wins regardless of where in
// the text the keyword sits.
constexpr std::array<KeywordGroup, 3> k_groups = {{
    {Category::Test,  {"test", "spec", "coverage", "bench"}},
    {Category::Build, {"build", "compile", "bundle", "dev", "run", "start", "watch", "serve"}},
    {Category::Lint,  {"lint", "fmt", "format", "clippy", "check", "prettier", "eslint"}},
}};

std::string_view trim_left(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}

std::string_view trim(std::string_view s) {
    s = trim_left(s);
    size_t n = s.size();
    while (n > 0 && std::isspace(static_cast<unsigned char>(s[n-1]))) --n;
    return s.substr(0, n);
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto &c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Quoted separators (`git commit -m "a; b"`) are arguments, not chaining.
bool has_chaining(std::string_view s) {
    Lexer lx{std::string(s)};
    for (auto &t : lx.run()) {
        if (is_command_separator(t.kind)) return true;
    }
    return false;
}

} // namespace

std::string strip_cd_prefix(std::string_view text) {
    std::string_view t = trim_left(text);
    if (t.size() < 3 || !(t[0] == 'c' || t[0] == 'C') || !(t[1] == 'd' || t[1] == 'D')
        || !std::isspace(static_cast<unsigned char>(t[2]))) {
        return std::string(text);
    }
    size_t amp = t.find("&&");
    if (amp == std::string_view::npos) return std::string(text);
    std::string_view dir = trim(t.substr(3, amp - 3));
    if (dir.empty()) return std::string(text);
    for (char c : dir) {
        if (std::isspace(static_cast<unsigned char>(c))) return std::string(text);
    }
    return std::string(trim_left(t.substr(amp + 2)));
}

Category categorize(std::string_view text) {
    std::string stripped = lower(strip_cd_prefix(text));
    std::string_view body = trim_left(stripped);
    if (body.empty()) return Category::Other;

    if (body.substr(0, 4) == "git " && !has_chaining(body)) return Category::Git;

    for (auto &group : k_groups) {
        for (auto word : group.words) {
            if (word.empty()) continue;
            if (body.find(word) != std::string_view::npos) return group.category;
        }
    }
    return Category::Other;
}

const char* to_string(Category c) {
    switch (c) {
        case Category::Build: return "Build";
        case Category::Test: return "Test";
        case Category::Lint: return "Lint";
        case Category::Git: return "Git";
        case Category::Other: return "Other";
    }
    return "Other";
}

const char* log_dir_name(Category c) {
    switch (c) {
        case Category::Build: return "build";
        case Category::Test: return "test";
        case Category::Lint: return "lint";
        case Category::Git: return "git";
        case Category::Other: return "other";
    }
    return "other";
}

std::optional<Category> parse_category(std::string_view name) {
    std::string n = lower(trim(name));
    if (n == "build") return Category::Build;
    if (n == "test") return Category::Test;
    if (n == "lint") return Category::Lint;
    if (n == "git") return Category::Git;
    if (n == "other") return Category::Other;
    return std::nullopt;
}

} // namespace devdeck
