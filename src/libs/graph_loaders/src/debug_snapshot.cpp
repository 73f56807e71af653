#include <graph_loaders/snapshot_json.hpp>
#include <initializer_list>
#include <utility>

namespace graph_loaders {

graph_model::Snapshot generate_debug_snapshot() {
    graph_model::Snapshot out;
    out.generated_at = "2024-06-01T12:00:00.000Z";

    auto add_node = [&](const char* id,
        const char* label,
        const char* modality,
        const char* title,
        const char* created_at,
        std::initializer_list<std::pair<const char*, const char*>> props = {})
    {
        graph_model::GraphNode n;
        n.id = id;
        n.label = label;
        n.modality = modality;
        n.title = title;
        n.created_at = created_at;
        n.updated_at = created_at;
        for (const auto& [key, value] : props)
            n.props[key] = value;
        out.nodes.push_back(std::move(n));
    };
    auto add_edge = [&](const char* source, const char* type, const char* target) {
        graph_model::GraphEdge e;
        e.source = source;
        e.target = target;
        e.type = type;
        e.id = std::string(source) + "|" + type + "|" + target;
        out.edges.push_back(std::move(e));
    };

    add_node("component:payments", "Component", "component", "Payments", "2024-05-01T09:00:00Z",
        { {"repo_url", "https://github.com/example/payments"} });
    add_node("component:billing", "Component", "component", "Billing", "2024-05-02T09:00:00Z");
    add_node("component:auth", "Component", "component", "Auth gateway", "2024-05-03T09:00:00Z");

    add_node("service:ledger", "Service", "service", "Ledger service", "2024-05-04T10:00:00Z");
    add_node("api:charge", "ApiEndpoint", "api", "POST /v1/charge", "2024-05-05T10:30:00Z");
    add_node("api:refund", "ApiEndpoint", "api", "POST /v1/refund", "2024-05-06T11:00:00Z");

    add_node("doc:runbook", "Doc", "doc", "Payments runbook", "2024-05-07T08:00:00Z",
        { {"doc_url", "https://docs.example.com/payments/runbook"} });
    add_node("doc:auth-guide", "Doc", "doc", "Auth integration guide", "2024-05-08T08:00:00Z",
        { {"doc_url", "https://docs.example.com/auth/guide"} });

    add_node("git:pr-412", "PR", "git", "Retry idempotent charges", "2024-05-10T14:00:00Z",
        { {"pr_url", "https://github.com/example/payments/pull/412"}, {"author", "dev-a"} });
    add_node("git:commit-9f1c", "GitEvent", "git", "Bump refund timeout", "2024-05-12T16:20:00Z",
        { {"commit_url", "https://github.com/example/payments/commit/9f1c"} });

    add_node("slack:incident-88", "SlackThread", "slack", "#payments-oncall: charge latency", "2024-05-14T07:45:00Z",
        { {"slack_permalink", "https://example.slack.com/archives/C01/p88"} });
    add_node("slack:question-3", "SlackEvent", "slack", "How do refunds settle?", "2024-05-15T12:10:00Z");

    add_node("issue:PAY-101", "Issue", "issue", "Duplicate charges on retry", "2024-05-16T09:00:00Z",
        { {"issue_url", "https://tracker.example.com/PAY-101"}, {"priority", "high"} });
    add_node("issue:AUTH-7", "Issue", "issue", "Token refresh loop", "2024-05-18T09:00:00Z",
        { {"jira_url", "https://jira.example.com/browse/AUTH-7"} });

    add_node("signal:latency", "ActivitySignal", "signal", "Charge p95 latency spike", "2024-05-20T06:00:00Z");
    add_node("impact:checkout", "ImpactEvent", "impact", "Checkout degraded", "2024-05-21T06:30:00Z");

    add_edge("component:payments", "HAS_COMPONENT", "component:billing");
    add_edge("component:payments", "EXPOSES_ENDPOINT", "api:charge");
    add_edge("component:billing", "EXPOSES_ENDPOINT", "api:refund");
    add_edge("service:ledger", "ABOUT_COMPONENT", "component:billing");
    add_edge("doc:runbook", "DOC_DOCUMENTS_COMPONENT", "component:payments");
    add_edge("doc:auth-guide", "DESCRIBES_COMPONENT", "component:auth");
    add_edge("git:pr-412", "MODIFIES_COMPONENT", "component:payments");
    add_edge("git:commit-9f1c", "TOUCHES_COMPONENT", "component:billing");
    add_edge("slack:incident-88", "ABOUT_COMPONENT", "component:payments");
    add_edge("slack:question-3", "ABOUT_COMPONENT", "component:billing");
    add_edge("issue:PAY-101", "ABOUT_COMPONENT", "component:payments");
    add_edge("issue:AUTH-7", "ABOUT_COMPONENT", "component:auth");
    add_edge("signal:latency", "ABOUT_COMPONENT", "component:payments");
    add_edge("impact:checkout", "ABOUT_COMPONENT", "component:payments");
    add_edge("git:pr-412", "REFERENCES", "issue:PAY-101");

    out.meta = graph_model::compute_snapshot_meta(out);
    return out;
}

} // namespace graph_loaders
