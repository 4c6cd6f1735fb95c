//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_stride_tools.cpp
// Purpose: GoogleTests for the STRIDE threat modeling tool set
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "stridemcp/JsonRpcRouter.h"
#include "stridemcp/errors/Errors.h"
#include "stridemcp/tools/StrideTools.h"
#include "stridemcp/validation/PayloadValidator.h"

using namespace stridemcp;

namespace {

JSONValue parse(const std::string& text) {
    auto r = validation::ValidatePayload(text, validation::ValidationLimits{});
    EXPECT_TRUE(r.ok()) << text;
    return r.ok() ? r.document.value() : JSONValue{};
}

const JSONValue& member(const JSONValue& v, const std::string& key) {
    static const JSONValue kNull{nullptr};
    const JSONValue* m = FindMember(v, key);
    return m ? *m : kNull;
}

size_t arraySize(const JSONValue& v) {
    return v.isArray() ? std::get<JSONValue::Array>(v.value).size() : 0u;
}

bool arrayContains(const JSONValue& arr, const std::string& s) {
    if (!arr.isArray()) return false;
    for (const auto& item : std::get<JSONValue::Array>(arr.value)) {
        if (item && *item == JSONValue{s}) return true;
    }
    return false;
}

const char* kSampleThreats = R"([
    {"threat_id":"T001","threat_name":"Credential stuffing","stride_category":"S","severity":"High",
     "affected_component":"Login API","description":"Attackers replay leaked passwords"},
    {"threat_id":"T002","threat_name":"Order tampering","stride_category":"Tampering","severity":"Medium",
     "affected_component":"Checkout","description":"Price field modified in transit"},
    {"threat_id":"T003","threat_name":"Verbose errors","stride_category":"I","severity":"Low",
     "affected_component":"API gateway","description":"Stack traces leak | internal paths"}
])";

class StrideToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ToolRegistry>();
        tools::RegisterStrideTools(*registry);
    }

    // Invokes a handler directly, bypassing schema validation.
    JSONValue call(const std::string& name, const std::string& argsJson) {
        const ToolDescriptor* d = registry->Lookup(name);
        EXPECT_NE(d, nullptr) << name;
        if (d == nullptr) return JSONValue{};
        return d->handler(parse(argsJson));
    }

    std::string threatsArg(const char* key) const {
        return std::string("\"") + key + "\":" + kSampleThreats;
    }

    std::shared_ptr<ToolRegistry> registry;
};

} // namespace

TEST_F(StrideToolsTest, RegistersEightToolsInOrder) {
    const auto& all = registry->ListAll();
    ASSERT_EQ(all.size(), 8u);
    ASSERT_EQ(tools::StrideToolNames().size(), 8u);
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].tool.name, tools::StrideToolNames()[i]);
        EXPECT_FALSE(all[i].tool.description.empty());
        EXPECT_EQ(member(all[i].tool.inputSchema, "type"), JSONValue{"object"});
    }
    EXPECT_EQ(tools::StrideToolNames().front(), "get_stride_threat_framework");
    EXPECT_EQ(tools::StrideToolNames().back(), "get_repository_analysis_guide");
}

TEST_F(StrideToolsTest, RegisteringTwiceIsRejected) {
    EXPECT_THROW(tools::RegisterStrideTools(*registry), std::invalid_argument);
}

TEST_F(StrideToolsTest, FrameworkAppliesDefaults) {
    auto out = call("get_stride_threat_framework", R"({"app_description":"An online bookstore"})");
    const JSONValue& framework = member(out, "stride_framework");
    const JSONValue& categories = member(framework, "categories");
    for (const char* letter : {"S", "T", "R", "I", "D", "E"}) {
        const JSONValue& cat = member(categories, letter);
        EXPECT_TRUE(member(cat, "name").isString()) << letter;
        EXPECT_TRUE(member(cat, "description").isString()) << letter;
        EXPECT_GT(arraySize(member(cat, "threat_examples")), 0u) << letter;
    }
    const JSONValue& domains = member(framework, "extended_threat_domains");
    EXPECT_TRUE(member(domains, "traditional_web").isObject());
    EXPECT_TRUE(member(domains, "ai_ml_systems").isObject());
    EXPECT_TRUE(member(domains, "cloud_infrastructure").isObject());

    const JSONValue& ctx = member(out, "application_context");
    EXPECT_EQ(member(ctx, "app_description"), JSONValue{"An online bookstore"});
    EXPECT_EQ(member(ctx, "app_type"), JSONValue{"Web Application"});
    EXPECT_TRUE(arrayContains(member(ctx, "authentication_methods"), "Username/Password"));
    EXPECT_EQ(member(ctx, "internet_facing"), JSONValue{true});
    EXPECT_TRUE(arrayContains(member(ctx, "sensitive_data_types"), "User Data"));

    const JSONValue& focus = member(member(out, "analysis_guidance"), "focus_domains");
    EXPECT_TRUE(arrayContains(focus, "traditional_web"));
    EXPECT_FALSE(arrayContains(focus, "ai_ml_systems"));
}

TEST_F(StrideToolsTest, FrameworkHighlightsAiAndCloudContext) {
    auto out = call("get_stride_threat_framework",
        R"({"app_description":"Customer support chatbot using an LLM with RAG, hosted in the cloud",
            "app_type":"AI Assistant","internet_facing":false,"authentication_methods":["OAuth2","SSO"]})");
    const JSONValue& ctx = member(out, "application_context");
    EXPECT_EQ(member(ctx, "internet_facing"), JSONValue{false});
    EXPECT_TRUE(arrayContains(member(ctx, "authentication_methods"), "SSO"));
    const JSONValue& focus = member(member(out, "analysis_guidance"), "focus_domains");
    EXPECT_TRUE(arrayContains(focus, "ai_ml_systems"));
    EXPECT_TRUE(arrayContains(focus, "cloud_infrastructure"));
}

TEST_F(StrideToolsTest, MitigationsFilterByPriority) {
    auto out = call("generate_threat_mitigations", "{" + threatsArg("threats") + R"(,"priority_filter":"high"})");
    const JSONValue& controls = member(member(out, "mitigation_framework"), "control_types");
    EXPECT_TRUE(member(controls, "preventive").isObject());
    EXPECT_TRUE(member(controls, "detective").isObject());
    EXPECT_TRUE(member(controls, "corrective").isObject());
    EXPECT_TRUE(member(out, "implementation_guidance").isObject());
    EXPECT_EQ(member(out, "priority_filter"), JSONValue{"high"});
    EXPECT_EQ(std::get<int64_t>(member(out, "threat_count").value), 3);

    const JSONValue& scope = member(out, "threats_in_scope");
    ASSERT_EQ(arraySize(scope), 1u);
    const JSONValue& first = *std::get<JSONValue::Array>(scope.value)[0];
    EXPECT_EQ(member(first, "threat_id"), JSONValue{"T001"});
    EXPECT_EQ(member(first, "stride_category"), JSONValue{"Spoofing"});

    auto all = call("generate_threat_mitigations", "{" + threatsArg("threats") + "}");
    EXPECT_EQ(member(all, "priority_filter"), JSONValue{"all"});
    EXPECT_EQ(arraySize(member(all, "threats_in_scope")), 3u);
}

TEST_F(StrideToolsTest, AttackTreesDefaultsAndBounds) {
    auto out = call("create_threat_attack_trees", "{" + threatsArg("threats") + "}");
    EXPECT_TRUE(member(member(out, "attack_tree_framework"), "common_patterns").isObject());
    EXPECT_TRUE(member(member(out, "attack_tree_framework"), "output_formats").isObject());
    EXPECT_EQ(member(out, "requested_format"), JSONValue{"both"});
    EXPECT_EQ(std::get<int64_t>(member(out, "max_depth").value), 3);
    EXPECT_EQ(std::get<int64_t>(member(out, "threat_count").value), 3);

    EXPECT_THROW(call("create_threat_attack_trees", R"({"threats":[],"max_depth":0})"), errors::ToolArgumentError);
    EXPECT_THROW(call("create_threat_attack_trees", R"({"threats":[],"max_depth":11})"), errors::ToolArgumentError);
    EXPECT_THROW(call("create_threat_attack_trees", R"({"threats":[],"max_depth":1e30})"), errors::ToolArgumentError);
    EXPECT_THROW(call("create_threat_attack_trees", R"({"threats":[],"max_depth":-1e30})"), errors::ToolArgumentError);
    EXPECT_THROW(call("create_threat_attack_trees", R"({"threats":[],"output_format":"svg"})"), errors::ToolArgumentError);

    auto mermaid = call("create_threat_attack_trees", R"({"threats":[],"max_depth":10,"output_format":"mermaid"})");
    EXPECT_EQ(member(mermaid, "requested_format"), JSONValue{"mermaid"});
    EXPECT_EQ(std::get<int64_t>(member(mermaid, "max_depth").value), 10);
}

TEST_F(StrideToolsTest, RiskScoresCarryDreadCriteria) {
    auto out = call("calculate_threat_risk_scores", "{" + threatsArg("threats") + "}");
    const JSONValue& dread = member(out, "dread_framework");
    const JSONValue& criteria = member(dread, "scoring_criteria");
    for (const char* c : {"damage", "reproducibility", "exploitability", "affected_users", "discoverability"}) {
        EXPECT_TRUE(member(member(criteria, c), "description").isString()) << c;
        EXPECT_TRUE(member(member(criteria, c), "scale").isString()) << c;
    }
    const JSONValue& levels = member(dread, "risk_levels");
    for (const char* l : {"critical", "high", "medium", "low"}) {
        EXPECT_TRUE(member(levels, l).isObject()) << l;
    }
    EXPECT_EQ(arraySize(member(dread, "examples")), 3u);
    EXPECT_EQ(std::get<int64_t>(member(out, "threat_count").value), 3);
    EXPECT_EQ(arraySize(member(out, "threats_to_score")), 3u);
}

TEST_F(StrideToolsTest, SecurityTestsValidateOptions) {
    auto out = call("generate_security_tests", "{" + threatsArg("threats") + "}");
    EXPECT_EQ(member(out, "requested_test_type"), JSONValue{"mixed"});
    EXPECT_EQ(member(out, "requested_format"), JSONValue{"gherkin"});
    const JSONValue& fw = member(out, "testing_framework");
    EXPECT_TRUE(member(member(fw, "test_types"), "penetration").isString());
    EXPECT_TRUE(member(member(fw, "format_examples"), "checklist").isString());

    auto unit = call("generate_security_tests", R"({"threats":[],"test_type":"unit","format_type":"markdown"})");
    EXPECT_EQ(member(unit, "requested_test_type"), JSONValue{"unit"});
    EXPECT_EQ(member(unit, "requested_format"), JSONValue{"markdown"});

    EXPECT_THROW(call("generate_security_tests", R"({"threats":[],"test_type":"fuzz"})"), errors::ToolArgumentError);
    EXPECT_THROW(call("generate_security_tests", R"({"threats":[],"format_type":"pdf"})"), errors::ToolArgumentError);
}

TEST_F(StrideToolsTest, ReportIsMarkdownWithDefaultSections) {
    const std::string args = "{" + threatsArg("threat_model") +
        R"(,"mitigations":[{"threat_id":"T001","mitigation_id":"M001","strategy":"Enforce MFA","control_type":"Preventive","priority":"High"}],
            "dread_scores":[{"threat_id":"T001","dread_score":{"total":38,"risk_level":"High"}}]})";
    auto out = call("generate_threat_report", args);
    ASSERT_TRUE(out.isString());
    const std::string md = std::get<std::string>(out.value);
    EXPECT_EQ(md.rfind("# STRIDE Threat Model Report", 0), 0u);
    EXPECT_NE(md.find("## Executive Summary"), std::string::npos);
    EXPECT_NE(md.find("## Threats"), std::string::npos);
    EXPECT_NE(md.find("## Mitigations"), std::string::npos);
    EXPECT_NE(md.find("## Risk Scores"), std::string::npos);
    EXPECT_EQ(md.find("## Attack Trees"), std::string::npos);
    EXPECT_NE(md.find("### T001: Credential stuffing"), std::string::npos);
    EXPECT_NE(md.find("**Threats identified:** 3"), std::string::npos);
    EXPECT_NE(md.find("Enforce MFA"), std::string::npos);
    EXPECT_NE(md.find("| T001 | 38 | High |"), std::string::npos);
    EXPECT_NE(md.find("Tampering"), std::string::npos);
}

TEST_F(StrideToolsTest, ReportHonorsIncludeSections) {
    auto out = call("generate_threat_report",
        "{" + threatsArg("threat_model") + R"(,"include_sections":["threats","attack_trees"],"attack_trees":[{"goal":"Take over account"}]})");
    const std::string md = std::get<std::string>(out.value);
    EXPECT_EQ(md.find("## Executive Summary"), std::string::npos);
    EXPECT_EQ(md.find("## Mitigations"), std::string::npos);
    EXPECT_NE(md.find("## Threats"), std::string::npos);
    EXPECT_NE(md.find("## Attack Trees"), std::string::npos);
    EXPECT_NE(md.find("Take over account"), std::string::npos);
}

TEST_F(StrideToolsTest, CoverageReportsMissingCategories) {
    auto out = call("validate_threat_coverage",
        "{" + threatsArg("threat_model") + R"(,"app_context":{"app_type":"Web Application"}})");
    const JSONValue& fw = member(out, "validation_framework");
    EXPECT_TRUE(member(fw, "coverage_criteria").isObject());
    EXPECT_EQ(arraySize(member(fw, "common_gaps")), 6u);

    const JSONValue& analysis = member(out, "coverage_analysis");
    EXPECT_EQ(std::get<int64_t>(member(analysis, "threat_count").value), 3);
    const JSONValue& covered = member(analysis, "categories_covered");
    const JSONValue& missing = member(analysis, "categories_missing");
    EXPECT_TRUE(arrayContains(covered, "S"));
    EXPECT_TRUE(arrayContains(covered, "T"));
    EXPECT_TRUE(arrayContains(covered, "I"));
    EXPECT_TRUE(arrayContains(missing, "R"));
    EXPECT_TRUE(arrayContains(missing, "D"));
    EXPECT_TRUE(arrayContains(missing, "E"));
    EXPECT_EQ(std::get<int64_t>(member(member(analysis, "threats_per_category"), "T").value), 1);
    EXPECT_EQ(std::get<int64_t>(member(analysis, "uncategorized_threats").value), 0);
    EXPECT_EQ(arraySize(member(out, "recommendations")), 3u);
    EXPECT_EQ(member(member(out, "app_context"), "app_type"), JSONValue{"Web Application"});
}

TEST_F(StrideToolsTest, RepositoryGuideStages) {
    auto initial = call("get_repository_analysis_guide", "{}");
    EXPECT_EQ(member(initial, "stage"), JSONValue{"initial"});
    EXPECT_TRUE(member(initial, "guidance").isObject());
    EXPECT_GT(arraySize(member(initial, "next_steps")), 0u);
    EXPECT_TRUE(member(initial, "technology_specific_guides").isNull());

    auto deep = call("get_repository_analysis_guide",
        R"({"analysis_stage":"deep_dive","repository_context":{"framework_detected":"Django","primary_language":"python"}})");
    EXPECT_TRUE(member(deep, "technology_specific_guides").isObject());
    EXPECT_GT(arraySize(member(deep, "recommended_guide")), 0u);

    auto validation = call("get_repository_analysis_guide", R"({"analysis_stage":"validation"})");
    EXPECT_GT(arraySize(member(validation, "validation_checklist")), 0u);

    EXPECT_THROW(call("get_repository_analysis_guide", R"({"analysis_stage":"final"})"), errors::ToolArgumentError);
}

TEST_F(StrideToolsTest, SchemaErrorsThroughRouter) {
    auto router = MakeJsonRpcRouter(ServerInfo{}, registry, nullptr);

    auto out = router->route(parse(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"validate_threat_coverage","arguments":{"threat_model":[]}}})"));
    ASSERT_TRUE(out.response.IsError());
    EXPECT_EQ(std::get<int64_t>(member(out.response.error.value(), "code").value), -32602);
    EXPECT_NE(std::get<std::string>(member(out.response.error.value(), "message").value).find("app_context"),
              std::string::npos);

    out = router->route(parse(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"get_repository_analysis_guide","arguments":{"analysis_stage":"final"}}})"));
    ASSERT_TRUE(out.response.IsError());
    EXPECT_EQ(std::get<int64_t>(member(out.response.error.value(), "code").value), -32602);

    out = router->route(parse(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"create_threat_attack_trees","arguments":{"threats":[],"max_depth":42}}})"));
    ASSERT_TRUE(out.response.IsError());
    EXPECT_EQ(std::get<int64_t>(member(out.response.error.value(), "code").value), -32602);
    EXPECT_EQ(member(out.response.error.value(), "message"), JSONValue{"max_depth must be between 1 and 10"});

    out = router->route(parse(
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"create_threat_attack_trees","arguments":{"threats":[],"max_depth":1e30}}})"));
    ASSERT_TRUE(out.response.IsError());
    EXPECT_EQ(std::get<int64_t>(member(out.response.error.value(), "code").value), -32602);
    EXPECT_EQ(member(out.response.error.value(), "message"), JSONValue{"max_depth is out of range"});
}

TEST_F(StrideToolsTest, ReportThroughRouterIsTextContent) {
    auto router = MakeJsonRpcRouter(ServerInfo{}, registry, nullptr);
    auto out = router->route(parse(
        R"({"jsonrpc":"2.0","id":"r","method":"tools/call","params":{"name":"generate_threat_report","arguments":{"threat_model":[]}}})"));
    ASSERT_FALSE(out.response.IsError());
    const auto& content = std::get<JSONValue::Array>(member(out.response.result.value(), "content").value);
    ASSERT_EQ(content.size(), 1u);
    const std::string text = std::get<std::string>(member(*content[0], "text").value);
    EXPECT_EQ(text.rfind("# STRIDE Threat Model Report", 0), 0u);
    EXPECT_NE(text.find("_No threats provided._"), std::string::npos);
}
