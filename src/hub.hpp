#pragma once
#include "tool.hpp"
#include "approval.hpp"
#include "message.hpp"
#include "wire.hpp"
#include "interrupt.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace soulwire {

// Outcome of one dispatched call.
struct Dispatch {
    ToolCall call;
    ToolCallStatus status = ToolCallStatus::Pending;
    ToolResult result{false, ""};
};

// Tool Communication Hub: name-keyed registry plus approval-gated dispatch.
class Hub {
public:
    // Commits a wire message on behalf of the hub (approval traffic).
    using EmitFn = std::function<WireMessage(WireKind kind, const std::string& type,
                                             nlohmann::json payload,
                                             const std::optional<std::string>& turn_id,
                                             const std::optional<std::string>& tool_call_id)>;
    using ResultFn = std::function<void(const Dispatch&)>;

    explicit Hub(std::shared_ptr<Approval> approval);

    void set_emitter(EmitFn emit) { emit_ = std::move(emit); }
    void set_work_dir(const std::string& dir) { work_dir_ = dir; }

    // Registering a name twice replaces the earlier capability.
    void register_tool(std::shared_ptr<Tool> tool);
    void register_tool(const std::string& name, std::shared_ptr<Tool> tool);

    std::shared_ptr<Tool> find(const std::string& name) const;
    bool has_tool(const std::string& name) const { return tools_.count(name) > 0; }
    std::vector<ToolSpec> specs() const;
    std::vector<std::string> tool_names() const;
    size_t size() const { return tools_.size(); }

    Approval& approval() { return *approval_; }
    const std::shared_ptr<Approval>& approval_ptr() const { return approval_; }

    // Dispatch a single call. Throws HubError if no handler is registered.
    Dispatch dispatch(const ToolCall& call, const std::string& turn_id,
                      const InterruptToken& interrupt);

    // Dispatch the calls of one assistant message. Approval is resolved in
    // model order on the calling thread, consecutive approved parallel-safe
    // calls then run concurrently, everything else runs one at a time.
    // on_result is invoked on the calling thread, in model order.
    // Throws HubError before anything runs if any name has no handler.
    void dispatch_all(const std::vector<ToolCall>& calls, const std::string& turn_id,
                      const InterruptToken& interrupt, const ResultFn& on_result);

private:
    enum class Gate { Run, Denied, Interrupted };

    Gate authorize(const ToolCall& call, const Tool& tool, const std::string& turn_id,
                   const InterruptToken& interrupt);
    Dispatch execute(const ToolCall& call, Tool& tool, const std::string& turn_id,
                     const InterruptToken& interrupt) const;

    std::shared_ptr<Approval> approval_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
    EmitFn emit_;
    std::string work_dir_;
};

} // namespace soulwire
