// ---------------------------------------------------------------------------
// test_workspace_loader.cpp
//
// WorkspaceLoader 단위 테스트.
//
// [테스트 범위]
// - 전체 섹션 적용 및 summary 카운트
// - 모델 relation 폐포 / tuple 의 entity_type_id 연결
// - 미등록 hook / script 바인딩 거부
// - 순환 모델 거부
// - 컴파일되지 않는 스크립트 / 정책 거부, update_source 실패 시 이전 소스 유지
// - 첫 오류에서 중단 (앞선 섹션은 적용된 상태 유지)
// - 저장소 샘플 workspace 파일 로드
// ---------------------------------------------------------------------------

#include "authz/model_store.hpp"
#include "authz/tuple_store.hpp"
#include "config/workspace_loader.hpp"
#include "hooks/hook_registry.hpp"
#include "pipeline/script_repository.hpp"
#include "sandbox/secret_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#ifndef HOOKWARDEN_SOURCE_DIR
#define HOOKWARDEN_SOURCE_DIR "."
#endif

// ---------------------------------------------------------------------------
// Fixture: 빈 저장소 묶음
// ---------------------------------------------------------------------------
class WorkspaceLoaderTest : public ::testing::Test {
protected:
    WorkspaceTargets targets() {
        return WorkspaceTargets{hooks_, scripts_, models_, tuples_, secrets_};
    }

    HookRegistry             hooks_;
    InMemoryScriptRepository scripts_;
    InMemoryTupleStore       tuples_;
    InMemoryModelStore       models_{tuples_};
    InMemorySecretStore      secrets_;
};

// ---------------------------------------------------------------------------
// FullWorkspace_AppliesEverySection
// ---------------------------------------------------------------------------
TEST_F(WorkspaceLoaderTest, FullWorkspace_AppliesEverySection) {
    auto summary = WorkspaceLoader::load_from_string(R"(
secrets:
  - { name: API_TOKEN, value: s3cret, description: upstream token }
scripts:
  - id: deny_all
    source: return { allowed = false, error = "closed" }
  - id: add_claim
    name: Add claim
    source: return { allowed = true, data = { plan = "pro" } }
bindings:
  - { hook: before_signup, script: deny_all }
  - { hook: token_build, script: add_claim, ordinal: 5, enabled: false }
models:
  - entity_type: project
    relations:
      owner: []
      member: [owner]
    permissions:
      view: { relation: member }
tuples:
  - { entity_type: project, entity_id: p1, relation: owner, subject_type: user, subject_id: u1 }
)", targets());
    ASSERT_TRUE(summary.has_value()) << summary.error();

    EXPECT_EQ(summary->secrets, 1u);
    EXPECT_EQ(summary->scripts, 2u);
    EXPECT_EQ(summary->bindings, 2u);
    EXPECT_EQ(summary->models, 1u);
    EXPECT_EQ(summary->tuples, 1u);

    EXPECT_EQ(secrets_.lookup("API_TOKEN"), "s3cret");

    auto script = scripts_.find_script("deny_all");
    ASSERT_TRUE(script.has_value());
    EXPECT_EQ(script->name, "deny_all") << "name defaults to id";

    const auto token_bindings = scripts_.bindings_for("token_build");
    ASSERT_EQ(token_bindings.size(), 1u);
    EXPECT_EQ(token_bindings[0].ordinal, 5);
    EXPECT_FALSE(token_bindings[0].enabled);

    const ModelPtr project = models_.find("project");
    ASSERT_NE(project, nullptr);
    const RelationSet* member = project->satisfying_relations("member");
    ASSERT_NE(member, nullptr);
    EXPECT_TRUE(member->contains("owner")) << "owner implies member";

    auto tuple = tuples_.find_exact(TupleKey{"project", "p1", "owner", "user", "u1"});
    ASSERT_TRUE(tuple.has_value());
    EXPECT_EQ(tuple->entity_type_id, project->id);
}

TEST_F(WorkspaceLoaderTest, PolicyPermission_Loaded) {
    auto summary = WorkspaceLoader::load_from_string(R"(
models:
  - entity_type: invoice
    relations: { approver: [] }
    permissions:
      approve:
        relation: approver
        policy: return context.attributes.amount < 1000
)", targets());
    ASSERT_TRUE(summary.has_value()) << summary.error();

    const ModelPtr invoice = models_.find("invoice");
    ASSERT_NE(invoice, nullptr);
    const PermissionRule* rule = invoice->find_permission("approve");
    ASSERT_NE(rule, nullptr);
    ASSERT_TRUE(rule->policy.has_value());
    EXPECT_EQ(rule->policy_engine, "lua");
}

// ---------------------------------------------------------------------------
// 거부 케이스
// ---------------------------------------------------------------------------
TEST_F(WorkspaceLoaderTest, UnknownHook_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
scripts:
  - { id: s1, source: "return { allowed = true }" }
bindings:
  - { hook: before_teleport, script: s1 }
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("unknown hook 'before_teleport'"), std::string::npos)
        << summary.error();
}

TEST_F(WorkspaceLoaderTest, UnknownScript_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
bindings:
  - { hook: before_signup, script: ghost }
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("unknown script 'ghost'"), std::string::npos) << summary.error();
}

TEST_F(WorkspaceLoaderTest, CyclicModel_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
models:
  - entity_type: loop
    relations:
      a: [b]
      b: [a]
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("cycle"), std::string::npos) << summary.error();
    EXPECT_EQ(models_.find("loop"), nullptr) << "rejected model must not be stored";
}

TEST_F(WorkspaceLoaderTest, TupleWithUndefinedRelation_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
models:
  - { entity_type: doc, relations: { viewer: [] } }
tuples:
  - { entity_type: doc, entity_id: d1, relation: owner, subject_type: user, subject_id: u1 }
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("relation 'owner'"), std::string::npos) << summary.error();
}

TEST_F(WorkspaceLoaderTest, UncompilableScript_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
scripts:
  - { id: broken, source: "return { allowed = " }
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("script does not compile"), std::string::npos) << summary.error();
    EXPECT_FALSE(scripts_.find_script("broken").has_value());
}

TEST_F(WorkspaceLoaderTest, UncompilablePolicy_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
models:
  - entity_type: invoice
    relations: { approver: [] }
    permissions:
      approve:
        relation: approver
        policy: "return context.attributes.amount <"
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("policy does not compile"), std::string::npos) << summary.error();
    EXPECT_EQ(models_.find("invoice"), nullptr);
}

TEST_F(WorkspaceLoaderTest, UpdateSource_KeepsPreviousOnCompileError) {
    ASSERT_TRUE(scripts_.create_script("gate", "gate", "return { allowed = true }").has_value());
    auto updated = scripts_.update_source("gate", "return {");
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code, EngineErrorCode::kValidation);
    EXPECT_EQ(scripts_.find_script("gate")->source_code, "return { allowed = true }");
}

TEST_F(WorkspaceLoaderTest, MissingRequiredField_Rejected) {
    auto summary = WorkspaceLoader::load_from_string(R"(
scripts:
  - { name: nameless }
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("'id' is required"), std::string::npos) << summary.error();
}

// ---------------------------------------------------------------------------
// StopsAtFirstError_EarlierSectionsRemain
//   로드는 트랜잭션이 아니다. 실패 이전 섹션은 적용된 채로 남는다.
// ---------------------------------------------------------------------------
TEST_F(WorkspaceLoaderTest, StopsAtFirstError_EarlierSectionsRemain) {
    auto summary = WorkspaceLoader::load_from_string(R"(
secrets:
  - { name: KEPT, value: v }
scripts: "not a list"
)", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(secrets_.lookup("KEPT"), "v");
}

TEST_F(WorkspaceLoaderTest, EmptyDocument_NoChanges) {
    auto summary = WorkspaceLoader::load_from_string("", targets());
    ASSERT_TRUE(summary.has_value()) << summary.error();
    EXPECT_EQ(summary->scripts, 0u);
    EXPECT_EQ(tuples_.size(), 0u);
}

// ---------------------------------------------------------------------------
// LoadFile_RepositorySample
// ---------------------------------------------------------------------------
TEST_F(WorkspaceLoaderTest, LoadFile_RepositorySample) {
    const std::filesystem::path path =
        std::filesystem::path{HOOKWARDEN_SOURCE_DIR} / "config" / "workspace.yaml";
    auto summary = WorkspaceLoader::load(path, targets());
    ASSERT_TRUE(summary.has_value()) << summary.error();

    EXPECT_GE(summary->scripts, 1u);
    EXPECT_NE(models_.find("document"), nullptr);
    EXPECT_FALSE(scripts_.bindings_for("before_signup").empty());
}

TEST_F(WorkspaceLoaderTest, LoadFile_Missing) {
    auto summary = WorkspaceLoader::load("/nonexistent/workspace.yaml", targets());
    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().find("cannot open"), std::string::npos) << summary.error();
}
