//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StrideTools.cpp
// Purpose: STRIDE threat modeling tool set
//==========================================================================================================

#include "stridemcp/tools/StrideTools.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "logging/Logger.h"
#include "stridemcp/errors/Errors.h"
#include "stridemcp/validation/PayloadValidator.h"

namespace stridemcp {
namespace tools {

namespace {

using NodePtr = std::shared_ptr<JSONValue>;

//------------------------------ JSON helpers ------------------------------

// Decode a built-in JSON document; a failure here is a programming error in this file.
NodePtr parseStatic(std::string_view text) {
    auto r = validation::ValidatePayload(text, validation::ValidationLimits{});
    if (!r.ok()) {
        throw std::logic_error("built-in JSON document is invalid: " + validation::DescribeFailure(r.failure.value()));
    }
    return std::make_shared<JSONValue>(std::move(r.document.value()));
}

template <typename T>
void put(JSONValue::Object& obj, const std::string& key, T&& value) {
    obj[key] = std::make_shared<JSONValue>(std::forward<T>(value));
}

std::string stringArg(const JSONValue& args, const char* key, const std::string& def) {
    const JSONValue* v = FindMember(args, key);
    return (v && v->isString()) ? std::get<std::string>(v->value) : def;
}

bool boolArg(const JSONValue& args, const char* key, bool def) {
    const JSONValue* v = FindMember(args, key);
    return (v && std::holds_alternative<bool>(v->value)) ? std::get<bool>(v->value) : def;
}

int64_t intArg(const JSONValue& args, const char* key, int64_t def) {
    const JSONValue* v = FindMember(args, key);
    if (v == nullptr) return def;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) {
        // 2^63: integral doubles at or beyond it have no int64_t representation
        constexpr double kInt64Bound = 9223372036854775808.0;
        const double d = std::get<double>(v->value);
        if (!(d >= -kInt64Bound && d < kInt64Bound)) {
            throw errors::ToolArgumentError(std::string(key) + " is out of range");
        }
        return static_cast<int64_t>(d);
    }
    return def;
}

const JSONValue::Array& arrayArg(const JSONValue& args, const char* key) {
    static const JSONValue::Array empty;
    const JSONValue* v = FindMember(args, key);
    return (v && v->isArray()) ? std::get<JSONValue::Array>(v->value) : empty;
}

JSONValue stringList(std::initializer_list<const char*> items) {
    JSONValue::Array arr;
    for (const char* s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue{std::move(arr)};
}

// Plain text for a member of a threat/mitigation object; "-" when absent.
std::string textOf(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || v->isNull()) return "-";
    if (v->isString()) return std::get<std::string>(v->value);
    return SerializeJSON(*v);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

void requireOneOf(const std::string& name, const std::string& value, std::initializer_list<const char*> allowed) {
    std::string list;
    for (const char* a : allowed) {
        if (value == a) return;
        if (!list.empty()) list += ", ";
        list += a;
    }
    throw errors::ToolArgumentError(name + " must be one of: " + list);
}

//------------------------------ STRIDE categories ------------------------------

constexpr std::array<std::pair<const char*, const char*>, 6> kStrideCategories{{
    {"S", "Spoofing"},
    {"T", "Tampering"},
    {"R", "Repudiation"},
    {"I", "Information Disclosure"},
    {"D", "Denial of Service"},
    {"E", "Elevation of Privilege"},
}};

// Maps "T", "t" or "Tampering" to "T"; empty when unrecognized.
std::string categoryLetter(const std::string& raw) {
    const std::string v = lower(raw);
    for (const auto& [letter, name] : kStrideCategories) {
        if (v == lower(letter) || v == lower(name)) return letter;
    }
    return {};
}

std::string categoryName(const std::string& raw) {
    const std::string letter = categoryLetter(raw);
    for (const auto& [l, name] : kStrideCategories) {
        if (letter == l) return name;
    }
    return raw.empty() ? std::string("Uncategorized") : raw;
}

//------------------------------ Static frameworks ------------------------------

constexpr const char* kStrideFramework = R"json({
  "methodology": "STRIDE",
  "categories": {
    "S": {"name": "Spoofing", "description": "Impersonating a user, service or component to gain access it should not have",
          "threat_examples": ["Credential stuffing against the login endpoint", "Forged or replayed session tokens", "Spoofed service identities between microservices"]},
    "T": {"name": "Tampering", "description": "Unauthorized modification of data in transit, at rest or in processing",
          "threat_examples": ["SQL or NoSQL injection", "Parameter manipulation in API requests", "Unsigned configuration or update packages"]},
    "R": {"name": "Repudiation", "description": "Performing actions that cannot be traced back to the actor",
          "threat_examples": ["Missing audit logs for administrative actions", "Mutable or unprotected log storage", "Shared accounts without attribution"]},
    "I": {"name": "Information Disclosure", "description": "Exposure of information to parties not authorized to see it",
          "threat_examples": ["Verbose error messages with stack traces", "Insecure direct object references", "Unencrypted storage of sensitive data"]},
    "D": {"name": "Denial of Service", "description": "Degrading or denying service to legitimate users",
          "threat_examples": ["Unbounded request payloads", "Missing rate limiting on expensive operations", "Resource exhaustion through algorithmic complexity"]},
    "E": {"name": "Elevation of Privilege", "description": "Gaining capabilities beyond those granted",
          "threat_examples": ["Broken access control on administrative APIs", "Privilege escalation through mass assignment", "Container or sandbox escape"]}
  },
  "extended_threat_domains": {
    "traditional_web": {"focus": ["OWASP Top 10", "Session management", "Input validation", "Access control"]},
    "ai_ml_systems": {"focus": ["Prompt injection", "Training data poisoning", "Model extraction", "Sensitive data leakage through model output", "Excessive agency of tool-using agents"]},
    "cloud_infrastructure": {"focus": ["Misconfigured storage buckets", "Over-privileged IAM roles", "Exposed management interfaces", "Insecure secrets handling"]},
    "api_security": {"focus": ["Broken object level authorization", "Excessive data exposure", "Lack of resource limits"]},
    "supply_chain": {"focus": ["Compromised dependencies", "Build pipeline integrity", "Unsigned artifacts"]}
  }
})json";

constexpr const char* kAnalysisGuidance = R"json({
  "approach": [
    "Decompose the application into components, data stores, external entities and trust boundaries",
    "Trace each data flow that crosses a trust boundary",
    "Apply every STRIDE category to every component and data flow",
    "Record each threat with a scenario, the affected component and its potential impact",
    "Prioritize threats with DREAD scoring before planning mitigations"
  ],
  "threat_format": {
    "threat_id": "Unique identifier, e.g. T001",
    "threat_name": "Short descriptive name",
    "stride_category": "One of S, T, R, I, D, E",
    "description": "Attack scenario",
    "severity": "Critical, High, Medium or Low",
    "affected_component": "Component or data flow"
  }
})json";

constexpr const char* kMitigationFramework = R"json({
  "control_types": {
    "preventive": {"description": "Stop the threat from being realized", "examples": ["Input validation", "Parameterized queries", "Multi-factor authentication", "Least privilege"]},
    "detective": {"description": "Identify the threat while or after it occurs", "examples": ["Audit logging", "Intrusion detection", "Anomaly alerting", "Integrity monitoring"]},
    "corrective": {"description": "Limit damage and restore service after an incident", "examples": ["Incident response runbooks", "Backups and restore drills", "Credential rotation", "Automated rollback"]}
  },
  "stride_mitigations": {
    "S": ["Strong authentication with MFA", "Secure session management", "Mutual TLS between services"],
    "T": ["Input validation and output encoding", "Integrity checks and signatures", "Parameterized queries"],
    "R": ["Tamper-evident audit logs", "Per-user attribution of actions", "Time synchronization"],
    "I": ["Encryption in transit and at rest", "Generic error messages", "Object level authorization"],
    "D": ["Rate limiting and quotas", "Payload size and complexity limits", "Autoscaling and circuit breakers"],
    "E": ["Role based access control", "Server-side authorization on every request", "Sandboxing and least privilege"]
  }
})json";

constexpr const char* kImplementationGuidance = R"json({
  "prioritization": "Address Critical and High severity threats first, preferring preventive controls",
  "mitigation_format": {
    "threat_id": "Threat being mitigated",
    "mitigation_id": "Unique identifier, e.g. M001",
    "strategy": "What to implement",
    "control_type": "Preventive, Detective or Corrective",
    "difficulty": "Easy, Medium or Hard",
    "priority": "Critical, High, Medium or Low"
  },
  "defense_in_depth": "Combine at least one preventive and one detective control for each high severity threat"
})json";

constexpr const char* kDreadFramework = R"json({
  "scoring_criteria": {
    "damage": {"description": "How much damage a successful attack causes", "scale": "1 (minimal) to 10 (complete compromise)"},
    "reproducibility": {"description": "How reliably the attack can be repeated", "scale": "1 (very hard) to 10 (every time)"},
    "exploitability": {"description": "How much effort and skill the attack requires", "scale": "1 (expert, custom tooling) to 10 (novice, browser only)"},
    "affected_users": {"description": "How many users are impacted", "scale": "1 (single user) to 10 (all users)"},
    "discoverability": {"description": "How easy the vulnerability is to find", "scale": "1 (obscure) to 10 (publicly known)"}
  },
  "risk_levels": {
    "critical": {"range": "40-50", "action": "Fix immediately"},
    "high": {"range": "30-39", "action": "Fix in the current release"},
    "medium": {"range": "20-29", "action": "Schedule a fix"},
    "low": {"range": "5-19", "action": "Accept or fix opportunistically"}
  },
  "examples": [
    {"threat": "SQL injection in a public search endpoint",
     "dread_score": {"damage": 9, "reproducibility": 9, "exploitability": 8, "affected_users": 9, "discoverability": 8, "total": 43, "risk_level": "Critical"}},
    {"threat": "Verbose error messages revealing framework versions",
     "dread_score": {"damage": 3, "reproducibility": 9, "exploitability": 7, "affected_users": 5, "discoverability": 8, "total": 32, "risk_level": "High"}},
    {"threat": "Missing audit log for profile updates",
     "dread_score": {"damage": 4, "reproducibility": 5, "exploitability": 4, "affected_users": 3, "discoverability": 3, "total": 19, "risk_level": "Low"}}
  ]
})json";

constexpr const char* kAttackTreeFramework = R"json({
  "common_patterns": {
    "authentication_bypass": {"goal": "Gain access without valid credentials",
      "branches": ["Credential stuffing", "Session hijacking", "Password reset abuse", "Authentication logic flaws"]},
    "data_exfiltration": {"goal": "Extract sensitive data",
      "branches": ["Injection attacks", "Insecure direct object references", "Backup or log exposure", "Compromised third-party integrations"]},
    "service_disruption": {"goal": "Make the application unavailable",
      "branches": ["Volumetric flooding", "Oversized or deeply nested payloads", "Expensive query abuse", "Dependency outage"]},
    "privilege_escalation": {"goal": "Obtain administrative capabilities",
      "branches": ["Broken access control", "Mass assignment", "Vulnerable administrative interfaces", "Container escape"]}
  },
  "output_formats": {
    "text": "Indented tree using AND/OR markers",
    "mermaid": "Mermaid flowchart definition (graph TD)",
    "json": "Nested nodes with id, label, type (AND/OR) and children",
    "both": "Mermaid diagram followed by the JSON structure"
  },
  "node_types": {"AND": "All children are required", "OR": "Any child is sufficient"}
})json";

constexpr const char* kTestingFramework = R"json({
  "test_types": {
    "unit": "Validate individual security controls such as input validators and authorization checks",
    "integration": "Validate controls across components, e.g. authentication flows and session handling",
    "penetration": "Adversarial scenarios that attempt to exploit the threat end to end",
    "mixed": "A balanced combination of unit, integration and penetration tests"
  },
  "format_examples": {
    "gherkin": "Feature: SQL injection protection\n  Scenario: Search rejects injected SQL\n    Given the product search endpoint\n    When a user searches for \"' OR 1=1 --\"\n    Then the response contains no unrelated products\n    And the attempt is logged",
    "checklist": "- [ ] Search input is passed to the database as a bound parameter\n- [ ] Injected SQL returns no additional rows\n- [ ] Attempts are logged with the client address",
    "markdown": "### TC-001: SQL injection in product search\n**Threat:** T001\n**Steps:** Submit ' OR 1=1 -- as the search term\n**Expected:** No unrelated products are returned"
  },
  "coverage_guidance": "Write at least one test per threat and one negative test per mitigation"
})json";

constexpr const char* kValidationFramework = R"json({
  "coverage_criteria": {
    "stride_completeness": "Every STRIDE category is considered for every component",
    "component_coverage": "Every component and data flow crossing a trust boundary has at least one threat",
    "severity_distribution": "Severities are justified and not uniformly high or low",
    "mitigation_mapping": "Every high or critical threat has at least one mitigation",
    "context_alignment": "Threats reflect the application type, authentication methods and data sensitivity"
  },
  "common_gaps": [
    "Repudiation threats omitted because logging is assumed",
    "Denial of service limited to network flooding, ignoring payload and algorithmic abuse",
    "Third-party and supply chain components left out of scope",
    "Insider and administrative abuse not considered",
    "Secrets management and key rotation not analyzed",
    "AI/ML specific threats missing for applications using models"
  ]
})json";

constexpr const char* kRepositoryGuidance = R"json({
  "initial": {
    "objective": "Quick scan to understand the repository and its security-relevant surface",
    "steps": [
      "Read the README and architecture documentation",
      "Identify the primary language, framework and deployment model",
      "List entry points: HTTP routes, CLIs, message consumers and scheduled jobs",
      "Locate authentication, session and authorization code",
      "Identify data stores and external integrations"
    ],
    "outputs": ["app_description", "app_type", "authentication_methods", "internet_facing", "sensitive_data_types"]
  },
  "deep_dive": {
    "objective": "Detailed security analysis of the components found during the initial scan",
    "steps": [
      "Review input handling and validation on every entry point",
      "Trace sensitive data from ingestion to storage and output",
      "Review authorization checks on state-changing operations",
      "Inspect secrets handling, configuration and infrastructure as code",
      "Review dependency manifests for outdated or risky packages"
    ],
    "outputs": ["trust_boundaries", "data_flows", "security_controls", "candidate_threats"]
  },
  "validation": {
    "objective": "Confirm the collected inputs are complete enough for threat modeling",
    "steps": [
      "Cross-check the application description against the code",
      "Confirm every external integration is listed",
      "Confirm authentication methods and data types are accurate"
    ],
    "outputs": ["readiness_assessment", "open_questions"]
  }
})json";

constexpr const char* kTechnologyGuides = R"json({
  "express": ["Check helmet and CORS configuration", "Review middleware order for authentication", "Look for unsanitized req.query and req.body use"],
  "django": ["Review settings.py for DEBUG and ALLOWED_HOSTS", "Check raw() and extra() queries", "Verify CSRF middleware is enabled"],
  "flask": ["Check SECRET_KEY handling", "Review Jinja2 autoescape settings", "Look for debug mode in production"],
  "fastapi": ["Review dependency-injected authentication", "Check Pydantic models for over-permissive fields", "Verify CORS middleware origins"],
  "spring": ["Review Spring Security configuration", "Check actuator endpoint exposure", "Look for SpEL injection"],
  "rails": ["Check strong parameters", "Review secrets.yml and credentials", "Look for raw SQL in scopes"],
  "aspnet": ["Review authorization attributes", "Check anti-forgery token usage", "Inspect appsettings for secrets"],
  "kubernetes": ["Review RBAC roles and service accounts", "Check pod security contexts", "Look for secrets in manifests"],
  "terraform": ["Check IAM policies for wildcards", "Review public exposure of storage and databases", "Look for hardcoded credentials"]
})json";

constexpr const char* kValidationChecklist = R"json([
  "Application description covers purpose, users and main workflows",
  "Application type is identified",
  "All authentication methods are listed",
  "Internet exposure is confirmed",
  "Sensitive data types are listed",
  "External integrations and third-party services are listed",
  "Deployment environment is known"
])json";

//------------------------------ Handlers ------------------------------

bool mentionsAiOrMl(const std::string& text) {
    const std::string t = " " + lower(text) + " ";
    for (const char* kw : {" ai ", "ai-", "llm", "machine learning", " ml ", " rag", "model", "chatbot", "neural"}) {
        if (t.find(kw) != std::string::npos) return true;
    }
    return false;
}

JSONValue getStrideThreatFramework(const JSONValue& args, const NodePtr& framework, const NodePtr& guidance) {
    const std::string description = stringArg(args, "app_description", "");
    const std::string appType = stringArg(args, "app_type", "Web Application");

    JSONValue::Object context;
    put(context, "app_description", description);
    put(context, "app_type", appType);
    const JSONValue* auth = FindMember(args, "authentication_methods");
    put(context, "authentication_methods", auth ? *auth : stringList({"Username/Password"}));
    put(context, "internet_facing", boolArg(args, "internet_facing", true));
    const JSONValue* sensitive = FindMember(args, "sensitive_data_types");
    put(context, "sensitive_data_types", sensitive ? *sensitive : stringList({"User Data"}));

    // Domains to emphasize for this application
    JSONValue::Array focus;
    focus.push_back(std::make_shared<JSONValue>("traditional_web"));
    if (mentionsAiOrMl(description) || mentionsAiOrMl(appType)) {
        focus.push_back(std::make_shared<JSONValue>("ai_ml_systems"));
    }
    if (lower(description).find("cloud") != std::string::npos || lower(appType).find("cloud") != std::string::npos) {
        focus.push_back(std::make_shared<JSONValue>("cloud_infrastructure"));
    }

    JSONValue::Object analysis = std::get<JSONValue::Object>(guidance->value);
    put(analysis, "focus_domains", JSONValue{std::move(focus)});
    put(analysis, "internet_exposure", std::string(boolArg(args, "internet_facing", true)
        ? "Internet facing: treat every external entry point as untrusted"
        : "Internal: still consider insider threats and lateral movement"));

    JSONValue::Object result;
    result["stride_framework"] = framework;
    put(result, "application_context", JSONValue{std::move(context)});
    put(result, "analysis_guidance", JSONValue{std::move(analysis)});
    return JSONValue{std::move(result)};
}

JSONValue generateThreatMitigations(const JSONValue& args, const NodePtr& framework, const NodePtr& guidance) {
    const auto& threats = arrayArg(args, "threats");
    const std::string filter = stringArg(args, "priority_filter", "all");

    JSONValue::Array inScope;
    for (const auto& t : threats) {
        if (!t) continue;
        if (lower(filter) == "all" || lower(textOf(*t, "severity")) == lower(filter)) {
            JSONValue::Object entry;
            put(entry, "threat_id", textOf(*t, "threat_id"));
            put(entry, "threat_name", textOf(*t, "threat_name"));
            put(entry, "stride_category", categoryName(textOf(*t, "stride_category")));
            inScope.push_back(std::make_shared<JSONValue>(std::move(entry)));
        }
    }

    JSONValue::Object result;
    result["mitigation_framework"] = framework;
    result["implementation_guidance"] = guidance;
    put(result, "priority_filter", filter);
    put(result, "threat_count", static_cast<int64_t>(threats.size()));
    put(result, "threats_in_scope", JSONValue{std::move(inScope)});
    return JSONValue{std::move(result)};
}

JSONValue createThreatAttackTrees(const JSONValue& args, const NodePtr& framework) {
    const int64_t maxDepth = intArg(args, "max_depth", 3);
    if (maxDepth < 1 || maxDepth > 10) {
        throw errors::ToolArgumentError("max_depth must be between 1 and 10");
    }
    const std::string format = stringArg(args, "output_format", "both");
    requireOneOf("output_format", format, {"text", "mermaid", "json", "both"});

    JSONValue::Object result;
    result["attack_tree_framework"] = framework;
    put(result, "requested_format", format);
    put(result, "max_depth", maxDepth);
    put(result, "threat_count", static_cast<int64_t>(arrayArg(args, "threats").size()));
    return JSONValue{std::move(result)};
}

JSONValue calculateThreatRiskScores(const JSONValue& args, const NodePtr& framework) {
    const auto& threats = arrayArg(args, "threats");
    JSONValue::Array toScore;
    for (const auto& t : threats) {
        if (!t) continue;
        JSONValue::Object entry;
        put(entry, "threat_id", textOf(*t, "threat_id"));
        put(entry, "threat_name", textOf(*t, "threat_name"));
        put(entry, "stated_severity", textOf(*t, "severity"));
        toScore.push_back(std::make_shared<JSONValue>(std::move(entry)));
    }

    JSONValue::Object result;
    result["dread_framework"] = framework;
    put(result, "threat_count", static_cast<int64_t>(threats.size()));
    put(result, "threats_to_score", JSONValue{std::move(toScore)});
    if (const JSONValue* g = FindMember(args, "scoring_guidance")) {
        put(result, "scoring_guidance", *g);
    }
    return JSONValue{std::move(result)};
}

JSONValue generateSecurityTests(const JSONValue& args, const NodePtr& framework) {
    const std::string testType = stringArg(args, "test_type", "mixed");
    requireOneOf("test_type", testType, {"unit", "integration", "penetration", "mixed"});
    const std::string format = stringArg(args, "format_type", "gherkin");
    requireOneOf("format_type", format, {"gherkin", "checklist", "markdown"});

    JSONValue::Object result;
    result["testing_framework"] = framework;
    put(result, "requested_test_type", testType);
    put(result, "requested_format", format);
    put(result, "threat_count", static_cast<int64_t>(arrayArg(args, "threats").size()));
    return JSONValue{std::move(result)};
}

std::string tableCell(std::string s) {
    std::string out;
    for (char c : s) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    return out;
}

std::string generateThreatReport(const JSONValue& args) {
    const auto& threats = arrayArg(args, "threat_model");
    const auto& mitigations = arrayArg(args, "mitigations");
    const auto& scores = arrayArg(args, "dread_scores");
    const auto& trees = arrayArg(args, "attack_trees");

    std::vector<std::string> sections;
    const JSONValue* include = FindMember(args, "include_sections");
    if (include && include->isArray()) {
        for (const auto& s : std::get<JSONValue::Array>(include->value)) {
            if (s && s->isString()) sections.push_back(std::get<std::string>(s->value));
        }
    } else {
        sections = {"executive_summary", "threats", "mitigations", "risk_scores"};
    }
    auto wants = [&sections](const char* name) {
        return std::find(sections.begin(), sections.end(), name) != sections.end();
    };

    std::map<std::string, int> perCategory;
    int highOrCritical = 0;
    for (const auto& t : threats) {
        if (!t) continue;
        ++perCategory[categoryName(textOf(*t, "stride_category"))];
        const std::string sev = lower(textOf(*t, "severity"));
        if (sev == "high" || sev == "critical") ++highOrCritical;
    }

    std::ostringstream md;
    md << "# STRIDE Threat Model Report\n\n";
    md << "This report summarizes the threats identified with the STRIDE methodology, "
          "together with the proposed mitigations and risk scores.\n\n";

    if (wants("executive_summary")) {
        md << "## Executive Summary\n\n";
        md << "- **Threats identified:** " << threats.size() << "\n";
        md << "- **STRIDE categories covered:** " << perCategory.size() << "\n";
        md << "- **High or critical severity threats:** " << highOrCritical << "\n";
        md << "- **Mitigations proposed:** " << mitigations.size() << "\n\n";
        if (!perCategory.empty()) {
            md << "| STRIDE Category | Threats |\n|---|---|\n";
            for (const auto& [name, count] : perCategory) {
                md << "| " << tableCell(name) << " | " << count << " |\n";
            }
            md << "\n";
        }
    }

    if (wants("threats")) {
        md << "## Threats\n\n";
        if (threats.empty()) {
            md << "_No threats provided._\n\n";
        }
        for (const auto& t : threats) {
            if (!t) continue;
            md << "### " << textOf(*t, "threat_id") << ": " << textOf(*t, "threat_name") << "\n\n";
            md << "- **STRIDE Category:** " << categoryName(textOf(*t, "stride_category")) << "\n";
            md << "- **Severity:** " << textOf(*t, "severity") << "\n";
            md << "- **Affected Component:** " << textOf(*t, "affected_component") << "\n\n";
            md << textOf(*t, "description") << "\n\n";
        }
    }

    if (wants("mitigations")) {
        md << "## Mitigations\n\n";
        if (mitigations.empty()) {
            md << "_No mitigations provided._\n\n";
        } else {
            md << "| Threat | Mitigation | Strategy | Control Type | Priority |\n|---|---|---|---|---|\n";
            for (const auto& m : mitigations) {
                if (!m) continue;
                md << "| " << tableCell(textOf(*m, "threat_id")) << " | " << tableCell(textOf(*m, "mitigation_id"))
                   << " | " << tableCell(textOf(*m, "strategy")) << " | " << tableCell(textOf(*m, "control_type"))
                   << " | " << tableCell(textOf(*m, "priority")) << " |\n";
            }
            md << "\n";
        }
    }

    if (wants("risk_scores")) {
        md << "## Risk Scores\n\n";
        if (scores.empty()) {
            md << "_No DREAD scores provided._\n\n";
        } else {
            md << "| Threat | Total | Risk Level |\n|---|---|---|\n";
            for (const auto& s : scores) {
                if (!s) continue;
                const JSONValue* dread = FindMember(*s, "dread_score");
                const JSONValue& src = dread ? *dread : *s;
                md << "| " << tableCell(textOf(*s, "threat_id")) << " | " << tableCell(textOf(src, "total"))
                   << " | " << tableCell(textOf(src, "risk_level")) << " |\n";
            }
            md << "\n";
        }
    }

    if (wants("attack_trees") && !trees.empty()) {
        md << "## Attack Trees\n\n";
        for (const auto& tree : trees) {
            if (!tree) continue;
            md << "```json\n" << SerializeJSON(*tree) << "\n```\n\n";
        }
    }
    return md.str();
}

JSONValue validateThreatCoverage(const JSONValue& args, const NodePtr& framework) {
    const auto& threats = arrayArg(args, "threat_model");

    std::map<std::string, int64_t> counts;
    int64_t uncategorized = 0;
    for (const auto& t : threats) {
        if (!t) continue;
        const std::string letter = categoryLetter(textOf(*t, "stride_category"));
        if (letter.empty()) { ++uncategorized; } else { ++counts[letter]; }
    }

    JSONValue::Array covered;
    JSONValue::Array missing;
    JSONValue::Array recommendations;
    JSONValue::Object perCategory;
    for (const auto& [letter, name] : kStrideCategories) {
        const int64_t n = counts.count(letter) ? counts[letter] : 0;
        put(perCategory, letter, n);
        if (n > 0) {
            covered.push_back(std::make_shared<JSONValue>(letter));
        } else {
            missing.push_back(std::make_shared<JSONValue>(letter));
            recommendations.push_back(std::make_shared<JSONValue>(
                std::string("Add ") + name + " threats or document why the category does not apply"));
        }
    }
    if (uncategorized > 0) {
        recommendations.push_back(std::make_shared<JSONValue>(
            std::string("Assign a STRIDE category to every threat")));
    }

    JSONValue::Object analysis;
    put(analysis, "threat_count", static_cast<int64_t>(threats.size()));
    put(analysis, "threats_per_category", JSONValue{std::move(perCategory)});
    put(analysis, "categories_covered", JSONValue{std::move(covered)});
    put(analysis, "categories_missing", JSONValue{std::move(missing)});
    put(analysis, "uncategorized_threats", uncategorized);

    JSONValue::Object result;
    result["validation_framework"] = framework;
    put(result, "coverage_analysis", JSONValue{std::move(analysis)});
    put(result, "recommendations", JSONValue{std::move(recommendations)});
    if (const JSONValue* ctx = FindMember(args, "app_context")) {
        put(result, "app_context", *ctx);
    }
    return JSONValue{std::move(result)};
}

JSONValue getRepositoryAnalysisGuide(const JSONValue& args, const NodePtr& guidance,
                                     const NodePtr& techGuides, const NodePtr& checklist) {
    const std::string stage = stringArg(args, "analysis_stage", "initial");
    const JSONValue* stageGuide = FindMember(*guidance, stage);
    if (stageGuide == nullptr) {
        // Schema enum normally rejects this first
        throw errors::ToolArgumentError("analysis_stage must be one of: initial, deep_dive, validation");
    }

    JSONValue::Object result;
    put(result, "stage", stage);
    put(result, "guidance", *stageGuide);
    JSONValue::Array next;
    if (stage == "initial") {
        next.push_back(std::make_shared<JSONValue>("Call get_repository_analysis_guide with analysis_stage=deep_dive"));
    } else if (stage == "deep_dive") {
        result["technology_specific_guides"] = techGuides;
        next.push_back(std::make_shared<JSONValue>("Call get_repository_analysis_guide with analysis_stage=validation"));
    } else {
        result["validation_checklist"] = checklist;
        next.push_back(std::make_shared<JSONValue>("Call get_stride_threat_framework with the collected inputs"));
    }
    put(result, "next_steps", JSONValue{std::move(next)});

    if (const JSONValue* ctx = FindMember(args, "repository_context"); ctx && ctx->isObject()) {
        put(result, "repository_context", *ctx);
        const std::string framework = lower(stringArg(*ctx, "framework_detected", ""));
        if (!framework.empty()) {
            if (const JSONValue* guide = FindMember(*techGuides, framework)) {
                put(result, "recommended_guide", *guide);
            }
        }
    }
    return JSONValue{std::move(result)};
}

//------------------------------ Input schemas ------------------------------

constexpr const char* kThreatArraySchema =
    R"json({"type": "array", "items": {"type": "object", "additionalProperties": true}, "description": "%s"})json";

std::string threatArray(const std::string& description) {
    std::string s = kThreatArraySchema;
    s.replace(s.find("%s"), 2, description);
    return s;
}

} // namespace

const std::vector<std::string>& StrideToolNames() {
    static const std::vector<std::string> names{
        "get_stride_threat_framework",
        "generate_threat_mitigations",
        "create_threat_attack_trees",
        "calculate_threat_risk_scores",
        "generate_security_tests",
        "generate_threat_report",
        "validate_threat_coverage",
        "get_repository_analysis_guide",
    };
    return names;
}

void RegisterStrideTools(ToolRegistry& registry) {
    FUNC_SCOPE();
    const NodePtr strideFramework = parseStatic(kStrideFramework);
    const NodePtr analysisGuidance = parseStatic(kAnalysisGuidance);
    const NodePtr mitigationFramework = parseStatic(kMitigationFramework);
    const NodePtr implementationGuidance = parseStatic(kImplementationGuidance);
    const NodePtr dreadFramework = parseStatic(kDreadFramework);
    const NodePtr attackTreeFramework = parseStatic(kAttackTreeFramework);
    const NodePtr testingFramework = parseStatic(kTestingFramework);
    const NodePtr validationFramework = parseStatic(kValidationFramework);
    const NodePtr repositoryGuidance = parseStatic(kRepositoryGuidance);
    const NodePtr technologyGuides = parseStatic(kTechnologyGuides);
    const NodePtr validationChecklist = parseStatic(kValidationChecklist);

    registry.Register(
        "get_stride_threat_framework",
        "Get comprehensive STRIDE threat modeling framework and guidance for threat analysis",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "app_description": {"type": "string", "description": "Detailed description of the application architecture and functionality"},
                "app_type": {"type": "string", "description": "Type of application", "default": "Web Application"},
                "authentication_methods": {"type": "array", "items": {"type": "string"}, "description": "List of authentication methods used", "default": ["Username/Password"]},
                "internet_facing": {"type": "boolean", "description": "Whether the application is accessible from the internet", "default": true},
                "sensitive_data_types": {"type": "array", "items": {"type": "string"}, "description": "Types of sensitive data handled", "default": ["User Data"]}
            },
            "required": ["app_description"]
        })json"),
        [strideFramework, analysisGuidance](const JSONValue& args) {
            return getStrideThreatFramework(args, strideFramework, analysisGuidance);
        });

    registry.Register(
        "generate_threat_mitigations",
        "Generate actionable security mitigations for identified threats",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threats": )json" + threatArray("Array of threat objects") + R"json(,
                "priority_filter": {"type": "string", "description": "Filter by priority", "default": "all"}
            },
            "required": ["threats"]
        })json"),
        [mitigationFramework, implementationGuidance](const JSONValue& args) {
            return generateThreatMitigations(args, mitigationFramework, implementationGuidance);
        });

    registry.Register(
        "create_threat_attack_trees",
        "Generate application-wide attack tree showing common attack vectors",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threats": )json" + threatArray("Array of threat objects (used for context)") + R"json(,
                "max_depth": {"type": "integer", "description": "Maximum tree depth", "default": 3},
                "output_format": {"type": "string", "description": "Output format", "default": "both"}
            },
            "required": ["threats"]
        })json"),
        [attackTreeFramework](const JSONValue& args) {
            return createThreatAttackTrees(args, attackTreeFramework);
        });

    registry.Register(
        "calculate_threat_risk_scores",
        "Calculate DREAD risk scores to prioritize threats by severity",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threats": )json" + threatArray("Array of threat objects") + R"json(,
                "scoring_guidance": {"type": "object", "additionalProperties": true, "description": "Optional guidance for scoring adjustments"}
            },
            "required": ["threats"]
        })json"),
        [dreadFramework](const JSONValue& args) {
            return calculateThreatRiskScores(args, dreadFramework);
        });

    registry.Register(
        "generate_security_tests",
        "Generate security test cases to validate threat mitigations",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threats": )json" + threatArray("Array of threat objects") + R"json(,
                "test_type": {"type": "string", "description": "Type of tests", "default": "mixed"},
                "format_type": {"type": "string", "description": "Output format", "default": "gherkin"}
            },
            "required": ["threats"]
        })json"),
        [testingFramework](const JSONValue& args) {
            return generateSecurityTests(args, testingFramework);
        });

    registry.Register(
        "generate_threat_report",
        "Format complete threat analysis as professional markdown report",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threat_model": )json" + threatArray("Array of threat objects") + R"json(,
                "mitigations": )json" + threatArray("Optional array of mitigation strategies") + R"json(,
                "dread_scores": )json" + threatArray("Optional array of DREAD scores") + R"json(,
                "attack_trees": )json" + threatArray("Optional array of attack trees") + R"json(,
                "include_sections": {"type": "array", "items": {"type": "string"}, "description": "Sections to include in report",
                                     "default": ["executive_summary", "threats", "mitigations", "risk_scores"]}
            },
            "required": ["threat_model"]
        })json"),
        [](const JSONValue& args) {
            return JSONValue{generateThreatReport(args)};
        });

    registry.Register(
        "validate_threat_coverage",
        "Validate STRIDE coverage completeness and suggest threat model enhancements",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "threat_model": )json" + threatArray("Array of threat objects to validate") + R"json(,
                "app_context": {"type": "object", "additionalProperties": true, "description": "Application context information"}
            },
            "required": ["threat_model", "app_context"]
        })json"),
        [validationFramework](const JSONValue& args) {
            return validateThreatCoverage(args, validationFramework);
        });

    registry.Register(
        "get_repository_analysis_guide",
        "Get structured framework for extracting threat modeling inputs from repository analysis using GitHub MCP or similar tools",
        *parseStatic(R"json({
            "type": "object",
            "properties": {
                "analysis_stage": {
                    "type": "string",
                    "description": "Analysis stage: 'initial' (quick scan), 'deep_dive' (detailed security analysis), or 'validation' (readiness check)",
                    "enum": ["initial", "deep_dive", "validation"],
                    "default": "initial"
                },
                "repository_context": {
                    "type": "object",
                    "description": "Optional context about the repository",
                    "properties": {
                        "primary_language": {"type": "string", "description": "Primary programming language detected"},
                        "framework_detected": {"type": "string", "description": "Primary framework or platform detected"},
                        "repository_type": {"type": "string", "description": "Type of repository", "enum": ["application", "library", "infrastructure", "unknown"]}
                    }
                }
            },
            "required": []
        })json"),
        [repositoryGuidance, technologyGuides, validationChecklist](const JSONValue& args) {
            return getRepositoryAnalysisGuide(args, repositoryGuidance, technologyGuides, validationChecklist);
        });

    LOG_INFO("Registered {} STRIDE tools", registry.Size());
}

} // namespace tools
} // namespace stridemcp
