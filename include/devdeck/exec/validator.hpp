/*
 * Command security policy - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Decides whether a CommandSpec may be spawned. Direct specs must name an
 * allow-listed program. Shell specs (`sh -c <text>`) are tokenized and the
 * first program the shell would execute, after one leading `cd <dir> &&`,
 * must be allow-listed too. Chaining, pipes and redirections are accepted
 * only while the policy trusts its command source (developer-authored
 * project configuration, never runtime input).
 */
#pragma once
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/errors.hpp>
#include <optional>
#include <string>
#include <vector>

namespace devdeck {

struct ValidatorPolicy {
    bool trusted_config_source = true;       // allow shell metacharacters
    std::vector<std::string> extra_programs;  // project-specific additions
};

class Validator {
public:
    Validator() = default;
    explicit Validator(ValidatorPolicy policy) : m_policy(std::move(policy)) {}

    // nullopt when the spec may be spawned.
    std::optional<ExecError> validate(const CommandSpec& spec) const;

    // Command allow-list plus policy extras. Editors are accepted only for
    // interactive specs and are not part of this set.
    bool is_allowed_program(const std::string& name) const;
    static bool is_editor(const std::string& name);

    static const std::vector<std::string>& allowed_programs();
    static const std::vector<std::string>& allowed_editors();

    const ValidatorPolicy& policy() const { return m_policy; }

private:
    std::optional<ExecError> validate_shell_text(const std::string& text) const;

    ValidatorPolicy m_policy;
};

} // namespace devdeck
