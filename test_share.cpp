#include "blobseal/errors.hpp"
#include "blobseal/keybundle.hpp"
#include "blobseal/log.hpp"
#include "blobseal/share.hpp"

#include "test_support.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace blobseal_test;

namespace {

const std::string kOwner = "alice";
const std::string kResource = std::string(64, 'c');

std::int64_t InOneDay() {
    auto later = std::chrono::system_clock::now() + std::chrono::hours(24);
    return std::chrono::duration_cast<std::chrono::seconds>(later.time_since_epoch()).count();
}

struct Harness {
    blobseal::Session session;
    FakeSigner signer;
    FakeKeyDirectory keys;
    FakeDirectory r1{"dir-1"};
    FakeDirectory r2{"dir-2"};
    FakeDirectory r3{"dir-3"};
    blobseal::KeyBundle file_key = blobseal::keybundle::Generate();

    Harness() {
        keys.Publish(kOwner);
        keys.Publish("bob");
        keys.Publish("carol");
        blobseal::ResourceRecord record;
        record.content_hash = kResource;
        record.owner = kOwner;
        record.wrapped_key = blobseal::keybundle::Wrap(file_key, PublicKeyFor(kOwner));
        for (FakeDirectory* replica : {&r1, &r2, &r3}) {
            replica->records[kResource] = record;
        }
    }

    blobseal::ShareProtocol Protocol() { return blobseal::ShareProtocol(session, signer, keys, {&r1, &r2, &r3}); }

    int ShareCalls() const { return r1.share_calls + r2.share_calls + r3.share_calls; }
};

}  // namespace

int main() {
    blobseal::log::SetLevel(blobseal::log::Level::Off);

    Run("share to every replica", []() {
        Harness h;
        blobseal::ShareResult result = h.Protocol().Share(kResource, kOwner, {"bob", "carol"}, InOneDay());
        CheckEq(result.success_count, std::size_t{3}, "all replicas acknowledged");
        CheckEq(result.failure_count, std::size_t{0}, "no failures");
        const blobseal::ShareGrant& grant = h.r2.grants.at(0);
        CheckEq(grant.resource_id, kResource, "grant names the resource");
        CheckEq(grant.recipients.size(), std::size_t{2}, "one wrapped key per recipient");
        blobseal::KeyBundle bob = blobseal::keybundle::Unwrap(grant.recipients[0].wrapped_key, SecretFor("bob"));
        blobseal::KeyBundle carol = blobseal::keybundle::Unwrap(grant.recipients[1].wrapped_key, SecretFor("carol"));
        Check(bob.Key() == h.file_key.Key() && carol.Key() == h.file_key.Key(), "recipients open the file key");
        CheckThrows<blobseal::KeyError>(
            [&]() { blobseal::keybundle::Unwrap(grant.recipients[0].wrapped_key, SecretFor("carol")); },
            "keys are per recipient");
    });

    Run("partial quorum", []() {
        Harness h;
        h.r2.fail = true;
        blobseal::ShareResult result = h.Protocol().Share(kResource, kOwner, {"bob"}, InOneDay());
        CheckEq(result.success_count, std::size_t{2}, "two of three");
        CheckEq(result.failure_count, std::size_t{1}, "one failure");
        CheckEq(result.failed.at(0).replica, std::string("dir-2"), "failed replica named");
        Check(result.failed.at(0).error.find("NetworkError") == 0, "failure kind recorded");
    });

    Run("no quorum", []() {
        Harness h;
        h.r1.fail = true;
        h.r2.fail = true;
        h.r3.fail = true;
        CheckThrows<blobseal::QuorumError>([&]() { h.Protocol().Share(kResource, kOwner, {"bob"}, InOneDay()); },
                                           "every replica failed");
        Harness empty;
        CheckThrows<blobseal::QuorumError>(
            [&]() { blobseal::ShareProtocol(empty.session, empty.signer, empty.keys, {}).Share(
                        kResource, kOwner, {"bob"}, InOneDay()); },
            "no replicas configured");
    });

    Run("recipient keys resolved first", []() {
        Harness h;
        CheckThrows<blobseal::KeyError>(
            [&]() { h.Protocol().Share(kResource, kOwner, {"bob", "dave"}, InOneDay()); }, "dave has no key");
        CheckEq(h.ShareCalls(), 0, "nothing pushed");
        CheckEq(h.r1.queries + h.r2.queries + h.r3.queries, 0, "no directory traffic");
        CheckEq(h.signer.calls, 0, "owner secret not derived");
        h.keys.keys["dave"] = Bytes(65, 0x04);
        CheckThrows<blobseal::KeyError>(
            [&]() { h.Protocol().Share(kResource, kOwner, {"dave"}, InOneDay()); }, "malformed published key");
    });

    Run("argument validation", []() {
        Harness h;
        CheckThrows<std::invalid_argument>([&]() { h.Protocol().Share(kResource, kOwner, {}, InOneDay()); },
                                           "empty recipients");
        CheckThrows<std::invalid_argument>([&]() { h.Protocol().Share(kResource, kOwner, {"bob"}, 1000); },
                                           "expiry in the past");
        CheckThrows<blobseal::KeyError>(
            [&]() { h.Protocol().Share(std::string(64, 'd'), kOwner, {"bob"}, InOneDay()); }, "unknown resource");
    });

    Run("revoke", []() {
        Harness h;
        h.r3.fail = true;
        blobseal::ShareResult result = h.Protocol().Revoke(kResource, kOwner, "bob");
        CheckEq(result.success_count, std::size_t{2}, "two replicas revoked");
        CheckEq(h.r1.revokes.at(0).account, std::string("bob"), "revoked account");
        CheckEq(h.r1.revokes.at(0).resource_id, kResource, "revoked resource");
        h.r1.fail = true;
        h.r2.fail = true;
        CheckThrows<blobseal::QuorumError>([&]() { h.Protocol().Revoke(kResource, kOwner, "bob"); }, "no replica");
    });

    Run("combined keys", []() {
        CheckEq(blobseal::JoinCombinedKeys({"a", "b", "c"}), std::string("a||b||c"), "joined");
        std::vector<std::string> split = blobseal::SplitCombinedKeys("a||b||c");
        Check(split == std::vector<std::string>({"a", "b", "c"}), "split is the inverse");
        Check(blobseal::SplitCombinedKeys("").empty(), "empty list");
        CheckThrows<blobseal::ProtocolError>([]() { blobseal::JoinCombinedKeys({"a", "b|c"}); },
                                             "delimiter inside a key");
        CheckThrows<blobseal::ProtocolError>([]() { blobseal::SplitCombinedKeys("a|||b"); }, "stray delimiter");
    });

    Run("directory share", []() {
        Harness h;
        blobseal::KeyBundle second = blobseal::keybundle::Generate();
        std::string second_hash(64, 'e');
        blobseal::ResourceRecord second_record;
        second_record.content_hash = second_hash;
        second_record.owner = kOwner;
        second_record.wrapped_key = blobseal::keybundle::Wrap(second, PublicKeyFor(kOwner));
        for (FakeDirectory* replica : {&h.r1, &h.r2, &h.r3}) {
            replica->records[second_hash] = second_record;
        }

        std::string first_wrapped = h.r1.records[kResource].wrapped_key;
        for (FakeDirectory* replica : {&h.r1, &h.r2, &h.r3}) {
            replica->listings["/docs"] = {{"a.txt", false, kResource, first_wrapped}, {"sub", true, "", ""}};
            replica->listings["/docs/sub"] = {{"b.txt", false, second_hash, ""}};
        }
        blobseal::ShareResult result = h.Protocol().ShareDirectory("/docs", kOwner, {"bob"}, InOneDay());
        CheckEq(result.success_count, std::size_t{3}, "pushed to every replica");
        const blobseal::ShareGrant& grant = h.r1.grants.at(0);
        CheckEq(grant.directory_path, std::string("/docs"), "directory grant");
        Check(grant.resource_id.empty(), "no content hash on a directory grant");
        std::vector<std::string> keys = blobseal::SplitCombinedKeys(grant.recipients.at(0).wrapped_key);
        CheckEq(keys.size(), std::size_t{2}, "one key per file, recursively");
        Check(blobseal::keybundle::Unwrap(keys[0], SecretFor("bob")).Key() == h.file_key.Key(), "first file key");
        Check(blobseal::keybundle::Unwrap(keys[1], SecretFor("bob")).Key() == second.Key(), "nested file key");

        h.r1.malformed = true;
        h.r2.grants.clear();
        blobseal::ShareResult retried = h.Protocol().ShareDirectory("/docs", kOwner, {"bob"}, InOneDay());
        CheckEq(retried.success_count, std::size_t{2}, "listing served by the next replica");
        CheckEq(blobseal::SplitCombinedKeys(h.r2.grants.at(0).recipients.at(0).wrapped_key).size(), std::size_t{2},
                "both files still collected");
        h.r1.malformed = false;

        blobseal::ShareResult revoked = h.Protocol().RevokeDirectory("/docs", kOwner, "bob");
        CheckEq(revoked.success_count, std::size_t{3}, "directory revoke fans out");
        CheckEq(h.r2.revokes.at(0).directory_path, std::string("/docs"), "revoke names the directory");
    });

    Run("empty directory", []() {
        Harness h;
        for (FakeDirectory* replica : {&h.r1, &h.r2, &h.r3}) {
            replica->listings["/empty"] = {{"nothing", true, "", ""}};
        }
        CheckThrows<std::invalid_argument>(
            [&]() { h.Protocol().ShareDirectory("/empty", kOwner, {"bob"}, InOneDay()); }, "no files to share");
        CheckThrows<std::invalid_argument>(
            [&]() { h.Protocol().ShareDirectory("/missing", kOwner, {"bob"}, InOneDay()); }, "unlisted directory");
        CheckEq(h.ShareCalls(), 0, "no grant pushed");
    });

    Run("malformed replica response", []() {
        Harness h;
        h.r1.malformed = true;
        blobseal::ShareResult result = h.Protocol().Share(kResource, kOwner, {"bob"}, InOneDay());
        CheckEq(result.success_count, std::size_t{2}, "owner key read from the next replica");
        CheckEq(result.failed.at(0).error.rfind("ProtocolError", 0), std::size_t{0}, "bad replica reported");
        h.r2.malformed = true;
        h.r3.malformed = true;
        CheckThrows<blobseal::QuorumError>([&]() { h.Protocol().Share(kResource, kOwner, {"bob"}, InOneDay()); },
                                           "no replica usable");
    });

    Run("share info", []() {
        Harness h;
        h.Protocol().Share(kResource, kOwner, {"bob"}, InOneDay());
        h.r1.fail = true;
        blobseal::ShareGrant grant = h.Protocol().ShareInfo(kResource, kOwner);
        CheckEq(grant.recipients.at(0).account, std::string("bob"), "grant from the next replica");
        h.r2.fail = true;
        h.r3.fail = true;
        CheckThrows<blobseal::QuorumError>([&]() { h.Protocol().ShareInfo(kResource, kOwner); }, "all replicas down");
    });

    return Summary("test_share");
}
