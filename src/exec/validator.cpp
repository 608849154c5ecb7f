/*
 * Command security policy implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/validator.hpp>
#include <devdeck/lex/lexer.hpp>
#include <algorithm>
#include <cctype>

namespace devdeck {

namespace {

const std::vector<std::string> k_programs = {
    "cargo", "rustc", "rustfmt", "clippy-driver",
    "go", "gofmt",
    "bun", "npm", "node", "npx", "pnpm", "yarn", "deno",
    "git",
    "make", "cmake", "ctest", "ninja",
    "python", "python3", "pip", "pip3", "pytest",
    "sh", "bash",
    "which",
};

const std::vector<std::string> k_editors = {
    "vim", "vi", "nano", "emacs", "nvim", "micro", "hx",
};

// Run inside the already-approved interpreter, never exec'd on their own.
const std::vector<std::string> k_shell_builtins = {
    "echo", "printf", "true", "false", "exit", "test", "[", ":", "cd", "export",
};

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

} // namespace

const std::vector<std::string>& Validator::allowed_programs() { return k_programs; }
const std::vector<std::string>& Validator::allowed_editors() { return k_editors; }

bool Validator::is_editor(const std::string& name) { return contains(k_editors, name); }

bool Validator::is_allowed_program(const std::string& name) const {
    return contains(k_programs, name) || contains(m_policy.extra_programs, name);
}

std::optional<ExecError> Validator::validate(const CommandSpec& spec) const {
    if (spec.program().empty() || is_blank(spec.program()))
        return ExecError{ErrorKind::EmptyCommand, "empty command"};
    bool editor_ok = spec.mode() == ExecMode::Interactive && is_editor(spec.program());
    if (!is_allowed_program(spec.program()) && !editor_ok)
        return ExecError{ErrorKind::NotWhitelisted, "command '" + spec.program() + "' not in whitelist"};
    if (spec.is_interpreter() && !spec.is_shell()) {
        return ExecError{ErrorKind::NotWhitelisted,
                         "interpreter '" + spec.program() + "' is only accepted as '" + spec.program() + " -c <text>'"};
    }
    if (spec.is_shell()) {
        if (is_blank(spec.shell_text()))
            return ExecError{ErrorKind::EmptyCommand, "empty shell command"};
        return validate_shell_text(spec.shell_text());
    }
    return std::nullopt;
}

std::optional<ExecError> Validator::validate_shell_text(const std::string& text) const {
    if (!m_policy.trusted_config_source) {
        // Command substitution and control characters never reach the lexer.
        for (size_t i = 0; i < text.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (c == '`' || (c == '$' && i + 1 < text.size() && text[i+1] == '('))
                return ExecError{ErrorKind::UntrustedShellSyntax, "command substitution from untrusted source"};
            if (c < 0x20 && c != '\t')
                return ExecError{ErrorKind::UntrustedShellSyntax, "control character in untrusted command text"};
        }
    }
    Lexer lx(text);
    TokenStream ts = lx.run();
    for (auto &t : ts) {
        if (t.kind == TokenKind::Invalid)
            return ExecError{ErrorKind::NotWhitelisted, "unparseable command text near offset " + std::to_string(t.pos)};
        if (!m_policy.trusted_config_source && is_shell_operator(t.kind))
            return ExecError{ErrorKind::UntrustedShellSyntax, "shell operator '" + t.lexeme + "' from untrusted source"};
    }
    size_t i = 0;
    while (i < ts.size() && ts[i].kind == TokenKind::Semi && ts[i].lexeme == "\n") ++i;
    // One leading `cd <dir> &&` is a working-directory hop, not the program.
    if (ts.size() > i + 3 && ts[i].kind == TokenKind::Word && ts[i].lexeme == "cd"
        && ts[i+1].kind == TokenKind::Word && ts[i+2].kind == TokenKind::AndIf) {
        i += 3;
    }
    while (i < ts.size() && ts[i].kind == TokenKind::Assign) ++i;
    if (i >= ts.size() || ts[i].kind == TokenKind::Eof)
        return ExecError{ErrorKind::EmptyCommand, "no program in '" + text + "'"};
    if (ts[i].kind != TokenKind::Word)
        return ExecError{ErrorKind::NotWhitelisted, "command text must start with a program name: '" + text + "'"};
    const std::string& program = ts[i].lexeme;
    if (is_allowed_program(program) || contains(k_shell_builtins, program)) return std::nullopt;
    return ExecError{ErrorKind::NotWhitelisted, "command '" + program + "' not in whitelist"};
}

} // namespace devdeck
