#pragma once
#include <string>

namespace soulwire {

// Values substituted into a system prompt template.
struct PromptArgs {
    std::string now;        // ${SOULWIRE_NOW}
    std::string work_dir;   // ${SOULWIRE_WORK_DIR}
    std::string agents_md;  // ${SOULWIRE_AGENTS_MD}
};

// Collect the builtin arguments for a working directory.
PromptArgs make_prompt_args(const std::string& work_dir);

// Replace every ${NAME} placeholder known in PromptArgs. Unknown
// placeholders are left untouched.
std::string build_system_prompt(const std::string& tmpl, const PromptArgs& args);

// Contents of AGENTS.md in the working directory wrapped in a section
// header, or empty if the file does not exist.
std::string load_agents_md(const std::string& work_dir);

} // namespace soulwire
