/**
 * @file test_guard.cpp
 * @brief Tests for the load / check / mutate / persist cycle
 */

#include <gtest/gtest.h>

#include "statpatch/ConcurrencyGuard.hpp"
#include "statpatch/MemoryDocumentStore.hpp"

#include <cstddef>
#include <optional>

using namespace statpatch;

namespace {

const std::string kKey = "zoo/stats.json";

PatchRequest make_request(const Value& ops) {
    PatchRequest request;
    request.app_name = "zoo";
    request.ops = ops;
    return request;
}

// Store whose metadata probe and body read report different tags, as a
// blob store does when the object changes between the two calls.
class SplitTagStore : public DocumentStore {
public:
    std::optional<std::string> probe_tag;
    std::optional<StoredDocument> body;
    std::size_t writes = 0;

    std::optional<std::string> probe(const std::string&) override { return probe_tag; }
    std::optional<StoredDocument> read_body(const std::string&) override { return body; }

    WriteReceipt write(const std::string&, const Value& document) override {
        ++writes;
        body = StoredDocument{document, std::string("\"written\"")};
        return WriteReceipt{"\"written\"", std::nullopt};
    }
};

} // namespace

class GuardTest : public ::testing::Test {
protected:
    using Call = MemoryDocumentStore::Call;

    MemoryDocumentStore store{true};
    ConcurrencyGuard guard{store};
};

// ============================================================================
// Happy path
// ============================================================================

TEST_F(GuardTest, CreatesDocumentWhenMissing) {
    auto result = guard.run(kKey, make_request(Value::parse(R"([
        {"op": "inc", "path": "totals.visits", "by": 1},
        {"op": "merge", "path": "countries", "value": {"MX": 1}},
        {"op": "append", "path": "recent", "value": {"name": "page_view"}}
    ])")));

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.stage, Stage::Done);
    EXPECT_EQ(result.applied, 3u);
    EXPECT_FALSE(result.dry_run);
    EXPECT_EQ(result.document, Value::parse(
        R"({"totals":{"visits":1},"countries":{"MX":1},"recent":[{"name":"page_view"}]})"));
    EXPECT_EQ(result.etag, store.probe(kKey));
    EXPECT_EQ(result.version_id, std::optional<std::string>("1"));
    EXPECT_EQ(Value::parse(*store.raw(kKey)), result.document);
}

TEST_F(GuardTest, UpdatesExistingDocument) {
    store.write(kKey, {{"totals", {{"visits", 4}}}});
    auto result = guard.run(kKey, make_request(Value::parse(R"([{"op":"inc","path":"totals.visits","by":3}])")));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.document["totals"]["visits"], 7);
    EXPECT_EQ(Value::parse(*store.raw(kKey))["totals"]["visits"], 7);
}

TEST_F(GuardTest, EmptyOpsRewritesDocument) {
    store.write(kKey, {{"a", 1}});
    auto result = guard.run(kKey, make_request(Value::array()));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.document, Value::parse(R"({"a":1})"));
    EXPECT_EQ(store.calls(Call::Write), 2u);
}

TEST_F(GuardTest, ReadsProbeThenBody) {
    guard.run(kKey, make_request(Value::array()));
    EXPECT_EQ(store.calls(Call::Probe), 1u);
    EXPECT_EQ(store.calls(Call::Read), 1u);
}

// ============================================================================
// Not found
// ============================================================================

TEST_F(GuardTest, MissingDocumentWithoutCreateIsNotFound) {
    auto request = make_request(Value::parse(R"([{"op":"inc","path":"n"}])"));
    request.create_if_missing = false;
    auto result = guard.run(kKey, request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::NotFound);
    EXPECT_EQ(result.message, "Stats file not found");
    EXPECT_EQ(store.calls(Call::Write), 0u);
}

TEST_F(GuardTest, EmptyDocumentWithoutCreateIsNotFound) {
    store.put_raw(kKey, "");
    auto request = make_request(Value::array());
    request.create_if_missing = false;
    auto result = guard.run(kKey, request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::NotFound);
}

TEST_F(GuardTest, ExistingDocumentWithoutCreateIsUpdated) {
    store.write(kKey, {{"n", 1}});
    auto request = make_request(Value::parse(R"([{"op":"inc","path":"n"}])"));
    request.create_if_missing = false;
    auto result = guard.run(kKey, request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.document["n"], 2);
}

// ============================================================================
// Version check
// ============================================================================

TEST_F(GuardTest, MatchingTagIsAccepted) {
    auto tag = store.write(kKey, {{"n", 1}}).version_tag;
    auto request = make_request(Value::parse(R"([{"op":"inc","path":"n"}])"));
    request.if_match_etag = tag;
    auto result = guard.run(kKey, request);
    ASSERT_TRUE(result.ok());
    EXPECT_NE(result.etag, std::optional<std::string>(tag));
}

TEST_F(GuardTest, MismatchedTagIsConflictBeforeAnyMutation) {
    store.write(kKey, {{"n", 1}});
    const std::string before = *store.raw(kKey);

    auto request = make_request(Value::parse(R"([{"op":"bogus"}])"));
    request.if_match_etag = "\"stale\"";
    auto result = guard.run(kKey, request);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Conflict);
    EXPECT_EQ(result.stage, Stage::Checking);
    EXPECT_EQ(result.message, "ETag mismatch, please retry");
    EXPECT_EQ(result.applied, 0u);
    EXPECT_EQ(store.calls(Call::Write), 1u);
    EXPECT_EQ(*store.raw(kKey), before);
}

TEST_F(GuardTest, NewDocumentNeverConflicts) {
    auto request = make_request(Value::parse(R"([{"op":"set","path":"a","value":1}])"));
    request.if_match_etag = "\"anything\"";
    auto result = guard.run(kKey, request);
    EXPECT_TRUE(result.ok());
}

TEST_F(GuardTest, ConcurrentWriterIsDetectedByTag) {
    auto seen = store.write(kKey, {{"n", 1}}).version_tag;
    store.write(kKey, {{"n", 5}});  // another writer

    auto request = make_request(Value::parse(R"([{"op":"inc","path":"n"}])"));
    request.if_match_etag = seen;
    auto result = guard.run(kKey, request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Conflict);
    EXPECT_EQ(Value::parse(*store.raw(kKey))["n"], 5);
}

// ============================================================================
// Atomicity of the batch
// ============================================================================

TEST_F(GuardTest, FailedOpAbortsWholeBatch) {
    store.write(kKey, {{"x", 0}});
    const std::string before = *store.raw(kKey);

    auto result = guard.run(kKey, make_request(Value::parse(R"([
        {"op": "set", "path": "x", "value": "not-a-number"},
        {"op": "inc", "path": "x"},
        {"op": "set", "path": "never", "value": true}
    ])")));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Validation);
    EXPECT_EQ(result.stage, Stage::Mutating);
    EXPECT_EQ(result.message, "inc target is not numeric");
    EXPECT_EQ(result.applied, 1u);
    EXPECT_TRUE(result.document.empty());
    EXPECT_EQ(*store.raw(kKey), before);
    EXPECT_EQ(store.calls(Call::Write), 1u);
}

TEST_F(GuardTest, MalformedOpIsValidation) {
    auto result = guard.run(kKey, make_request(Value::parse(R"([{"op":"set","path":"a"}])")));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Validation);
    EXPECT_EQ(result.message, "set op requires 'value'");
    EXPECT_FALSE(store.raw(kKey).has_value());
}

TEST_F(GuardTest, StrictPolicyFromOptions) {
    PatchOptions options;
    options.resolve.on_conflict = TypeConflictPolicy::Fail;
    ConcurrencyGuard strict(store, options);

    store.write(kKey, {{"a", {{"k", 1}}}});
    auto result = strict.run(kKey, make_request(Value::parse(R"([{"op":"set","path":"a.0","value":1}])")));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Validation);
}

// ============================================================================
// Dry run
// ============================================================================

TEST_F(GuardTest, DryRunNeverWrites) {
    auto tag = store.write(kKey, {{"n", 1}}).version_tag;
    auto request = make_request(Value::parse(R"([
        {"op": "inc", "path": "n"},
        {"op": "set", "path": "a.b", "value": 2},
        {"op": "delete", "path": "n"}
    ])"));
    request.dry_run = true;

    auto result = guard.run(kKey, request);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.dry_run);
    EXPECT_EQ(result.document, Value::parse(R"({"a":{"b":2}})"));
    EXPECT_EQ(result.etag, std::optional<std::string>(tag));
    EXPECT_FALSE(result.version_id.has_value());
    EXPECT_EQ(store.calls(Call::Write), 1u);
    EXPECT_EQ(Value::parse(*store.raw(kKey)), Value::parse(R"({"n":1})"));
}

TEST_F(GuardTest, ForcedDryRunOverridesRequest) {
    auto result = guard.run(kKey, make_request(Value::parse(R"([{"op":"inc","path":"n"}])")), true);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.dry_run);
    EXPECT_FALSE(result.etag.has_value());
    EXPECT_EQ(store.calls(Call::Write), 0u);
    EXPECT_FALSE(store.raw(kKey).has_value());
}

// ============================================================================
// Storage failures
// ============================================================================

TEST_F(GuardTest, ProbeFailureIsStorageError) {
    store.fail_next(Call::Probe, "access denied");
    auto result = guard.run(kKey, make_request(Value::array()));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Storage);
    EXPECT_EQ(result.stage, Stage::Loading);
    EXPECT_NE(result.message.find("access denied"), std::string::npos);
    EXPECT_EQ(store.calls(Call::Write), 0u);
}

TEST_F(GuardTest, CorruptBodyIsStorageError) {
    store.put_raw(kKey, "[1,2,3]");
    auto result = guard.run(kKey, make_request(Value::array()));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Storage);
    EXPECT_EQ(result.stage, Stage::Loading);
}

TEST_F(GuardTest, WriteFailureIsStorageError) {
    store.fail_next(Call::Write, "timeout");
    auto result = guard.run(kKey, make_request(Value::parse(R"([{"op":"inc","path":"n"}])")));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Storage);
    EXPECT_EQ(result.stage, Stage::Persisting);
    EXPECT_EQ(result.applied, 1u);
    EXPECT_FALSE(store.raw(kKey).has_value());
}

// ============================================================================
// Tag selection when probe and body disagree
// ============================================================================

class SplitTagTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.probe_tag = "\"head\"";
        store.body = StoredDocument{Value::parse(R"({"n":1})"), std::string("\"get\"")};
    }

    PatchRequest inc_request(const std::string& expected) {
        auto request = make_request(Value::parse(R"([{"op":"inc","path":"n"}])"));
        request.if_match_etag = expected;
        return request;
    }

    SplitTagStore store;
    ConcurrencyGuard guard{store};
};

TEST_F(SplitTagTest, BodyTagIsNotTheCurrentTag) {
    auto result = guard.run(kKey, inc_request("\"get\""));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, ErrorKind::Conflict);
    EXPECT_EQ(store.writes, 0u);
}

TEST_F(SplitTagTest, ProbeTagWinsAndIsReportedOnDryRun) {
    auto request = inc_request("\"head\"");
    request.dry_run = true;
    auto result = guard.run(kKey, request);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.etag, std::optional<std::string>("\"head\""));
    EXPECT_EQ(result.document["n"], 2);
    EXPECT_EQ(store.writes, 0u);
}

TEST_F(SplitTagTest, BodyTagUsedWhenProbeHasNone) {
    store.probe_tag.reset();
    auto result = guard.run(kKey, inc_request("\"get\""));
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(store.writes, 1u);
}

TEST_F(SplitTagTest, AbsentBodyDropsProbeTag) {
    store.body.reset();
    auto result = guard.run(kKey, inc_request("\"anything\""));
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.document, Value::parse(R"({"n":1})"));
    EXPECT_EQ(result.etag, std::optional<std::string>("\"written\""));
}

TEST(StageNames, Stable) {
    EXPECT_STREQ(to_string(Stage::Loading), "loading");
    EXPECT_STREQ(to_string(Stage::DryRunReturn), "dry_run_return");
    EXPECT_STREQ(to_string(ErrorKind::Conflict), "conflict");
}
