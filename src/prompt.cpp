#include "prompt.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace soulwire {

PromptArgs make_prompt_args(const std::string& work_dir) {
    PromptArgs args;
    args.now = timestamp_now();
    args.work_dir = work_dir;
    args.agents_md = load_agents_md(work_dir);
    return args;
}

std::string build_system_prompt(const std::string& tmpl, const PromptArgs& args) {
    const std::vector<std::pair<std::string, const std::string*>> vars = {
        {"${SOULWIRE_NOW}", &args.now},
        {"${SOULWIRE_WORK_DIR}", &args.work_dir},
        {"${SOULWIRE_AGENTS_MD}", &args.agents_md},
    };

    // Single pass: substituted text is never scanned again
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t start = tmpl.find("${", pos);
        if (start == std::string::npos) break;
        out.append(tmpl, pos, start - pos);
        bool replaced = false;
        for (const auto& [key, value] : vars) {
            if (tmpl.compare(start, key.size(), key) == 0) {
                out += *value;
                pos = start + key.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out += "${";
            pos = start + 2;
        }
    }
    if (pos < tmpl.size()) out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string load_agents_md(const std::string& work_dir) {
    std::filesystem::path path = std::filesystem::path(work_dir) / "AGENTS.md";
    std::ifstream file(path);
    if (!file.is_open()) return "";

    std::ostringstream ss;
    ss << file.rdbuf();
    std::string contents = trim(ss.str());
    if (contents.empty()) return "";
    return "\nProject notes (AGENTS.md):\n" + contents + "\n";
}

} // namespace soulwire
