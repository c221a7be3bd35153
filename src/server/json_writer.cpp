// ---------------------------------------------------------------------------
// json_writer.cpp
//
// 채점 결과/실패/지표/통계 → JSON 문자열.
// 모든 문자열 값은 json_escape 를 거친다 (학습자 출력에 제어 문자가 섞인다).
// ---------------------------------------------------------------------------

#include "server/json_writer.hpp"

#include <chrono>
#include <cstdio>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// "..." 로 감싼 이스케이프 문자열
std::string quote(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 2);
    out += '"';
    out += json_escape(sv);
    out += '"';
    return out;
}

std::string string_array(const std::vector<std::string>& items) {
    std::string out{"["};
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += quote(items[i]);
    }
    out += ']';
    return out;
}

std::string bool_str(bool v) {
    return v ? "true" : "false";
}

std::string probe_json(const ProbeResult& p) {
    return fmt::format(
        R"({{"name":{},"arguments":{},"return_value":{},"return_type":{},"attempts":{},"succeeded":{},"last_error":{}}})",
        quote(p.name), quote(p.arguments), quote(p.return_value), quote(p.return_type),
        p.attempts, bool_str(p.succeeded), quote(p.last_error));
}

} // namespace

std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

int http_status(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::kSyntaxInvalid:     return 400;
        case FailureKind::kPolicyViolation:   return 403;
        case FailureKind::kExecutionError:    return 422;
        case FailureKind::kTimeoutExceeded:   return 408;
        case FailureKind::kContractViolation: return 500;
        case FailureKind::kInternalError:     return 500;
    }
    return 500;
}

std::string to_json(const Diagnostics& d) {
    std::string probes{"["};
    for (std::size_t i = 0; i < d.probes.size(); ++i) {
        if (i > 0) {
            probes += ',';
        }
        probes += probe_json(d.probes[i]);
    }
    probes += ']';

    std::string classes{"["};
    for (std::size_t i = 0; i < d.classes.size(); ++i) {
        if (i > 0) {
            classes += ',';
        }
        classes += fmt::format(R"({{"name":{},"methods":{}}})",
                               quote(d.classes[i].name), string_array(d.classes[i].methods));
    }
    classes += ']';

    std::string variables{"["};
    for (std::size_t i = 0; i < d.variables.size(); ++i) {
        if (i > 0) {
            variables += ',';
        }
        const auto& v = d.variables[i];
        variables += fmt::format(R"({{"name":{},"type":{},"value":{}}})",
                                 quote(v.name), quote(v.type), quote(v.value));
    }
    variables += ']';

    const std::string expected = d.expected
        ? fmt::format(R"({{"subject":{},"literals":{}}})",
                      quote(d.expected->subject), string_array(d.expected->literals))
        : std::string{"null"};

    return fmt::format(
        R"({{"probes":{},"classes":{},"variables":{},"expected":{},"probes_complete":{}}})",
        probes, classes, variables, expected, bool_str(d.probes_complete));
}

std::string to_json(const GradeResult& r) {
    return fmt::format(
        R"({{"score":{},"max_score":{},"feedback":{},"stdout":{},"stderr":{},"diagnostics":{}}})",
        r.score, r.max_score, quote(r.feedback), quote(r.stdout_text), quote(r.stderr_text),
        r.diagnostics ? to_json(*r.diagnostics) : std::string{"null"});
}

std::string to_json(const MetricsSummary& s) {
    return fmt::format(
        R"({{"complexity":{},"coverage":{:.4f},"duplication":{:.4f},"has_type_hints":{},"has_docstring":{},"lines_of_code":{}}})",
        s.complexity, s.coverage, s.duplication, bool_str(s.has_type_hints),
        bool_str(s.has_docstring), s.lines_of_code);
}

std::string to_json(const RefactorAssessment& a) {
    return fmt::format(R"({{"applicable":{},"improved":{},"reason":{}}})",
                       bool_str(a.applicable), bool_str(a.improved), quote(a.reason));
}

// captured_at 은 Unix epoch 밀리초로 직렬화한다.
std::string to_json(const GradeStatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    std::string failures{"{"};
    for (std::size_t i = 0; i < kFailureKindCount; ++i) {
        if (i > 0) {
            failures += ',';
        }
        failures += fmt::format(R"("{}":{})", to_string(static_cast<FailureKind>(i)),
                                s.failures[i]);
    }
    failures += '}';

    return fmt::format(
        R"({{"total_requests":{},"in_flight":{},"graded":{},"graded_full":{},"failures":{},"contract_violations":{},"timeouts":{},"sandbox_launches":{},"pass_rate":{:.4f},"captured_at_ms":{}}})",
        s.total_requests, s.in_flight, s.graded, s.graded_full, failures,
        s.contract_violations(), s.timeouts(), s.sandbox_launches, s.pass_rate, epoch_ms);
}

std::string make_validation_payload(std::size_t node_count) {
    return fmt::format(R"({{"valid":true,"nodes":{}}})", node_count);
}

// ---------------------------------------------------------------------------
// make_ok_response
//   {"ok":true,"payload":<data>}
// ---------------------------------------------------------------------------
std::string make_ok_response(std::string_view payload) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", payload);
}

std::string make_error_response(const GradeFailure& f) {
    return fmt::format(
        R"({{"ok":false,"error":{},"kind":{},"status":{},"stage":{},"exception_type":{},"message":{},"trace":{},"stdout":{},"stderr":{},"line":{},"column":{}}})",
        quote(f.detail), quote(to_string(f.kind)), http_status(f.kind),
        quote(to_string(f.stage)), quote(f.exception_type), quote(f.message),
        string_array(f.trace), quote(f.stdout_text), quote(f.stderr_text), f.line, f.column);
}

std::string make_bad_request_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":{},"kind":"bad_request","status":{}}})",
                       quote(msg), kBadRequestStatus);
}
