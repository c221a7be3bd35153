// ---------------------------------------------------------------------------
// runner_message.cpp
//
// yaml-cpp Emitter / Load 기반 직렬화.
// 자유 텍스트(소스, 출력, 메시지)는 모두 DoubleQuoted 로 기록하여
// 제어 문자와 YAML 특수 문자를 이스케이프한다.
// ---------------------------------------------------------------------------

#include "protocol/runner_message.hpp"
#include "policy/policy_loader.hpp"

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

void emit_text(YAML::Emitter& out, const char* key, const std::string& value) {
    out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
}

void emit_lines(YAML::Emitter& out, const char* key, const std::vector<std::string>& lines) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& line : lines) {
        out << YAML::DoubleQuoted << line;
    }
    out << YAML::EndSeq;
}

[[nodiscard]] std::string text_of(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return {};
    }
    return node.as<std::string>();
}

[[nodiscard]] std::vector<std::string> lines_of(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    for (const auto& item : node) {
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] std::string_view event_name(RunnerEventType type) {
    switch (type) {
        case RunnerEventType::kSubmissionDone: return "submission_done";
        case RunnerEventType::kFailure:        return "failure";
        case RunnerEventType::kResult:         return "result";
        case RunnerEventType::kDiagnostics:    return "diagnostics";
    }
    return "failure";
}

void emit_failure(YAML::Emitter& out, const GradeFailure& f) {
    out << YAML::Key << "failure" << YAML::Value << YAML::BeginMap;
    emit_text(out, "kind", std::string{to_string(f.kind)});
    emit_text(out, "stage", std::string{to_string(f.stage)});
    emit_text(out, "detail", f.detail);
    emit_text(out, "exception_type", f.exception_type);
    emit_text(out, "message", f.message);
    emit_lines(out, "trace", f.trace);
    emit_text(out, "stdout", f.stdout_text);
    emit_text(out, "stderr", f.stderr_text);
    out << YAML::Key << "line" << YAML::Value << f.line;
    out << YAML::Key << "column" << YAML::Value << f.column;
    out << YAML::EndMap;
}

[[nodiscard]] std::expected<GradeFailure, std::string> parse_failure(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return std::unexpected(std::string{"failure event without 'failure' map"});
    }
    GradeFailure f{};
    const auto kind = failure_kind_from_string(text_of(node["kind"]));
    if (!kind) {
        return std::unexpected("unknown failure kind '" + text_of(node["kind"]) + "'");
    }
    f.kind           = *kind;
    f.stage          = grade_state_from_string(text_of(node["stage"])).value_or(GradeState::kFailed);
    f.detail         = text_of(node["detail"]);
    f.exception_type = text_of(node["exception_type"]);
    f.message        = text_of(node["message"]);
    f.trace          = lines_of(node["trace"]);
    f.stdout_text    = text_of(node["stdout"]);
    f.stderr_text    = text_of(node["stderr"]);
    f.line           = node["line"] ? node["line"].as<int>() : 0;
    f.column         = node["column"] ? node["column"].as<int>() : 0;
    return f;
}

void emit_diagnostics(YAML::Emitter& out, const Diagnostics& d) {
    out << YAML::Key << "probes" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : d.probes) {
        out << YAML::BeginMap;
        emit_text(out, "name", p.name);
        emit_text(out, "arguments", p.arguments);
        emit_text(out, "return_value", p.return_value);
        emit_text(out, "return_type", p.return_type);
        out << YAML::Key << "attempts" << YAML::Value << p.attempts;
        out << YAML::Key << "succeeded" << YAML::Value << p.succeeded;
        emit_text(out, "last_error", p.last_error);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "classes" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : d.classes) {
        out << YAML::BeginMap;
        emit_text(out, "name", c.name);
        emit_lines(out, "methods", c.methods);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "variables" << YAML::Value << YAML::BeginSeq;
    for (const auto& v : d.variables) {
        out << YAML::BeginMap;
        emit_text(out, "name", v.name);
        emit_text(out, "type", v.type);
        emit_text(out, "value", v.value);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

[[nodiscard]] Diagnostics parse_diagnostics(const YAML::Node& root) {
    Diagnostics d{};
    if (const auto probes = root["probes"]; probes && probes.IsSequence()) {
        for (const auto& n : probes) {
            ProbeResult p{};
            p.name         = text_of(n["name"]);
            p.arguments    = text_of(n["arguments"]);
            p.return_value = text_of(n["return_value"]);
            p.return_type  = text_of(n["return_type"]);
            p.attempts     = n["attempts"] ? n["attempts"].as<int>() : 0;
            p.succeeded    = n["succeeded"] ? n["succeeded"].as<bool>() : false;
            p.last_error   = text_of(n["last_error"]);
            d.probes.push_back(std::move(p));
        }
    }
    if (const auto classes = root["classes"]; classes && classes.IsSequence()) {
        for (const auto& n : classes) {
            d.classes.push_back(ClassInfo{text_of(n["name"]), lines_of(n["methods"])});
        }
    }
    if (const auto variables = root["variables"]; variables && variables.IsSequence()) {
        for (const auto& n : variables) {
            d.variables.push_back(
                VariableInfo{text_of(n["name"]), text_of(n["type"]), text_of(n["value"])});
        }
    }
    return d;
}

} // namespace

std::string encode_request(const RunnerRequest& request) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "policy" << YAML::Value;
    PolicyLoader::emit(out, request.policy);
    emit_text(out, "submission", request.submission);
    emit_text(out, "grader", request.grader);
    out << YAML::EndMap;
    return out.c_str();
}

std::expected<RunnerRequest, std::string> decode_request(std::string_view body) {
    try {
        const YAML::Node root = YAML::Load(std::string{body});
        if (!root.IsMap()) {
            return std::unexpected(std::string{"runner request is not a map"});
        }
        auto policy = PolicyLoader::from_node(root["policy"]);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        RunnerRequest request{};
        request.policy     = std::move(*policy);
        request.submission = text_of(root["submission"]);
        request.grader     = text_of(root["grader"]);
        return request;
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string{"malformed runner request: "} + e.what());
    }
}

std::string encode_event(const RunnerEvent& event) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    emit_text(out, "event", std::string{event_name(event.type)});

    if (event.type == RunnerEventType::kFailure && event.failure) {
        emit_failure(out, *event.failure);
    }
    if (event.type == RunnerEventType::kResult && event.grade) {
        const auto& g = *event.grade;
        out << YAML::Key << "score" << YAML::Value << g.score;
        out << YAML::Key << "max_score" << YAML::Value << g.max_score;
        emit_text(out, "feedback", g.feedback);
        emit_text(out, "stdout", g.stdout_text);
        emit_text(out, "stderr", g.stderr_text);
    }
    if (event.type == RunnerEventType::kDiagnostics && event.diagnostics) {
        emit_diagnostics(out, *event.diagnostics);
    }

    out << YAML::EndMap;
    return out.c_str();
}

std::expected<RunnerEvent, std::string> decode_event(std::string_view body) {
    try {
        const YAML::Node root = YAML::Load(std::string{body});
        if (!root.IsMap()) {
            return std::unexpected(std::string{"runner event is not a map"});
        }

        RunnerEvent event{};
        const std::string name = text_of(root["event"]);
        if (name == "submission_done") {
            event.type = RunnerEventType::kSubmissionDone;
        } else if (name == "failure") {
            event.type = RunnerEventType::kFailure;
            auto failure = parse_failure(root["failure"]);
            if (!failure) {
                return std::unexpected(failure.error());
            }
            event.failure = std::move(*failure);
        } else if (name == "result") {
            event.type = RunnerEventType::kResult;
            RawGrade g{};
            g.score       = root["score"].as<std::int64_t>();
            g.max_score   = root["max_score"].as<std::int64_t>();
            g.feedback    = text_of(root["feedback"]);
            g.stdout_text = text_of(root["stdout"]);
            g.stderr_text = text_of(root["stderr"]);
            event.grade   = std::move(g);
        } else if (name == "diagnostics") {
            event.type        = RunnerEventType::kDiagnostics;
            event.diagnostics = parse_diagnostics(root);
        } else {
            return std::unexpected("unknown runner event '" + name + "'");
        }
        return event;
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string{"malformed runner event: "} + e.what());
    }
}
