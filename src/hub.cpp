#include "hub.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <future>
#include <iostream>

namespace soulwire {

Hub::Hub(std::shared_ptr<Approval> approval)
    : approval_(approval ? std::move(approval) : std::make_shared<Approval>())
{}

void Hub::register_tool(std::shared_ptr<Tool> tool) {
    std::string name = tool->tool_name();
    register_tool(name, std::move(tool));
}

void Hub::register_tool(const std::string& name, std::shared_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register null tool: " + name);
    }
    tools_[name] = std::move(tool);
}

std::shared_ptr<Tool> Hub::find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) return nullptr;
    return it->second;
}

std::vector<ToolSpec> Hub::specs() const {
    std::vector<ToolSpec> result;
    result.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        ToolSpec spec = tool->spec();
        spec.name = name;
        result.push_back(std::move(spec));
    }
    return result;
}

std::vector<std::string> Hub::tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) names.push_back(name);
    return names;
}

Dispatch Hub::dispatch(const ToolCall& call, const std::string& turn_id,
                       const InterruptToken& interrupt) {
    Dispatch out;
    dispatch_all({call}, turn_id, interrupt, [&out](const Dispatch& d) { out = d; });
    return out;
}

Hub::Gate Hub::authorize(const ToolCall& call, const Tool& tool, const std::string& turn_id,
                         const InterruptToken& interrupt) {
    if (!approval_->requires_approval(call.name, tool.approval_policy())) return Gate::Run;
    if (interrupt.is_set()) return Gate::Interrupted;

    std::string request_id = generate_id();
    auto& broker = approval_->broker();
    broker.open(request_id);
    if (emit_) {
        emit_(WireKind::Request, wire_types::ApprovalRequest,
              {{"request_id", request_id},
               {"tool_name", call.name},
               {"arguments", call.arguments},
               {"description", tool.description()}},
              turn_id, call.id);
    }

    auto decision = broker.wait(request_id, interrupt);
    if (!decision) return Gate::Interrupted;

    if (emit_) {
        emit_(WireKind::Response, wire_types::ApprovalResponse,
              {{"request_id", request_id},
               {"decision", approval_decision_to_string(*decision)}},
              turn_id, call.id);
    }
    switch (*decision) {
        case ApprovalDecision::AlwaysAllow:
            approval_->allow_always(call.name);
            return Gate::Run;
        case ApprovalDecision::Approve:
            return Gate::Run;
        case ApprovalDecision::Deny:
            break;
    }
    return Gate::Denied;
}

Dispatch Hub::execute(const ToolCall& call, Tool& tool, const std::string& turn_id,
                      const InterruptToken& interrupt) const {
    Dispatch out;
    out.call = call;
    if (interrupt.is_set()) {
        out.status = ToolCallStatus::Interrupted;
        out.result = ToolResult{false, "Tool call interrupted before execution"};
        return out;
    }

    ToolContext ctx{call.id, turn_id, work_dir_, interrupt};
    try {
        out.result = tool.execute(call.arguments, ctx);
    } catch (const std::exception& e) {
        std::cerr << "[hub] Tool " << call.name << " threw: " << e.what() << '\n';
        out.result = ToolResult{false, std::string("Tool error: ") + e.what()};
    }
    out.status = out.result.success ? ToolCallStatus::Completed : ToolCallStatus::Failed;
    return out;
}

void Hub::dispatch_all(const std::vector<ToolCall>& calls, const std::string& turn_id,
                       const InterruptToken& interrupt, const ResultFn& on_result) {
    std::vector<std::shared_ptr<Tool>> handlers;
    handlers.reserve(calls.size());
    for (const auto& call : calls) {
        auto tool = find(call.name);
        if (!tool) {
            throw HubError("No handler registered for tool: " + call.name);
        }
        handlers.push_back(std::move(tool));
    }

    // Approval first, in model order
    std::vector<Gate> gates;
    gates.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); i++) {
        gates.push_back(authorize(calls[i], *handlers[i], turn_id, interrupt));
    }

    auto settle = [&](size_t i) {
        Dispatch out;
        out.call = calls[i];
        if (gates[i] == Gate::Denied) {
            out.status = ToolCallStatus::Denied;
            out.result = ToolResult{false,
                "Tool call denied by user. The " + calls[i].name +
                " tool was not executed; try a different approach."};
        } else {
            out.status = ToolCallStatus::Interrupted;
            out.result = ToolResult{false, "Tool call interrupted while awaiting approval"};
        }
        return out;
    };

    size_t i = 0;
    while (i < calls.size()) {
        if (gates[i] != Gate::Run) {
            on_result(settle(i));
            i++;
            continue;
        }
        if (!handlers[i]->parallel_safe()) {
            on_result(execute(calls[i], *handlers[i], turn_id, interrupt));
            i++;
            continue;
        }

        // Run of consecutive approved parallel-safe calls
        size_t end = i;
        while (end < calls.size() && gates[end] == Gate::Run && handlers[end]->parallel_safe()) {
            end++;
        }
        if (end - i == 1) {
            on_result(execute(calls[i], *handlers[i], turn_id, interrupt));
            i = end;
            continue;
        }
        std::vector<std::future<Dispatch>> running;
        running.reserve(end - i);
        for (size_t j = i; j < end; j++) {
            running.push_back(std::async(std::launch::async,
                [this, &calls, &handlers, &turn_id, &interrupt, j]() {
                    return execute(calls[j], *handlers[j], turn_id, interrupt);
                }));
        }
        for (auto& f : running) {
            on_result(f.get());
        }
        i = end;
    }
}

} // namespace soulwire
