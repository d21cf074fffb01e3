#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>

#include "PreviewOrchestrator.hpp"
#include "FileSealer.hpp"
#include "test_fixtures.hpp"

using namespace Vaultline;
using namespace Vaultline::test;

namespace {
const char* kUser = "user-123";
const char* kProof = "correct horse";
}

class PreviewOrchestratorTest : public ::testing::Test {
protected:
    PreviewOrchestratorTest() : gate(kProof) {}

    void put(const std::string& fileId, const std::string& name, const std::string& declaredType,
             const std::vector<unsigned char>& body) {
        FileSealer sealer(kdf, VAULTLINE_DEFAULT_CHUNK_SIZE, UploadPolicy());
        SealedFile sealed;
        ASSERT_EQ(sealer.seal(kUser, {name, declaredType}, body, sealed), ErrorCode::None);
        store.put(fileId, sealed);
    }

    std::unique_ptr<PreviewOrchestrator> makeOrchestrator(const PreviewSettings& settings = PreviewSettings()) {
        return std::unique_ptr<PreviewOrchestrator>(
            new PreviewOrchestrator(gate, store, resources, kdf, settings, &audit));
    }

    static PreviewRequest request(const std::string& fileId, const std::string& proof = kProof) {
        PreviewRequest r;
        r.fileId = fileId;
        r.stableUserId = kUser;
        r.reAuthProof = proof;
        return r;
    }

    std::string firstBytes(const ResourceHandle& handle, size_t n) {
        std::string out;
        resources.read(handle, [&](const std::vector<unsigned char>& bytes, DetectedKind) {
            out.assign(bytes.begin(), bytes.begin() + std::min(n, bytes.size()));
        });
        return out;
    }

    KeyDerivation kdf;
    FakeAccessGate gate;
    MemoryCiphertextStore store;
    EphemeralResourceStore resources;
    RecordingAuditSink audit;
};

TEST_F(PreviewOrchestratorTest, TenMegabytePdfDeclaredAsOctetStream) {
    std::vector<unsigned char> body = patternBytes(10 * 1024 * 1024);
    const std::string header = "%PDF-1.7\n";
    std::copy(header.begin(), header.end(), body.begin());
    put("f-report", "report.pdf", "application/octet-stream", body);

    auto orchestrator = makeOrchestrator();
    PreviewResult result = orchestrator->open(request("f-report"));

    ASSERT_TRUE(result.ok) << errorCodeName(result.error);
    EXPECT_EQ(result.detectedKind, DetectedKind::Pdf);
    EXPECT_FLOAT_EQ(result.sniffConfidence, 1.0f);
    EXPECT_EQ(result.metadata.name, "report.pdf");
    EXPECT_EQ(result.metadata.declaredType, "application/octet-stream");
    EXPECT_EQ(result.payload.decryptedSize, body.size());
    EXPECT_TRUE(result.payload.text.empty());

    ASSERT_TRUE(result.payload.resource.valid());
    EXPECT_EQ(firstBytes(result.payload.resource, 4), "%PDF");
    EXPECT_EQ(resources.size(result.payload.resource), body.size());

    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Rendered);
    EXPECT_EQ(orchestrator->liveHandle().id, result.payload.resource.id);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "decrypted", "classified"}));

    orchestrator->close();
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Released);
    EXPECT_FALSE(resources.isLive(result.payload.resource));
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types().back(), "released");
    EXPECT_EQ(audit.events.back().detail, "closed");
}

TEST_F(PreviewOrchestratorTest, TextIsInlinedAndTruncatedOnCharacterBoundary) {
    // Euro sign occupies bytes 9..11
    put("f-notes", "notes.txt", "text/plain", bytesOf("aaaaaaaaa\xE2\x82\xAC tail"));

    PreviewSettings settings;
    settings.previewTextLimit = 10;
    auto orchestrator = makeOrchestrator(settings);

    PreviewResult result = orchestrator->open(request("f-notes"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.detectedKind, DetectedKind::Text);
    EXPECT_EQ(result.payload.text, "aaaaaaaaa");
    EXPECT_TRUE(result.payload.truncated);
    EXPECT_FALSE(result.payload.resource.valid());
    EXPECT_EQ(resources.liveCount(), 0u);

    orchestrator->close();
    EXPECT_EQ(audit.types().back(), "released");
}

TEST_F(PreviewOrchestratorTest, ShortTextIsNotTruncated) {
    put("f-short", "hello.txt", "text/plain", bytesOf("hello\n"));
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-short"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload.text, "hello\n");
    EXPECT_FALSE(result.payload.truncated);
}

TEST_F(PreviewOrchestratorTest, SecondPreviewReleasesTheFirstBeforeRendering) {
    put("f-a", "a.png", "image/png", bytesOf(std::string("\x89PNG\r\n\x1a\n", 8) + "image data"));
    put("f-b", "b.pdf", "application/pdf", bytesOf("%PDF-1.4\nsecond"));
    auto orchestrator = makeOrchestrator();

    PreviewResult first = orchestrator->open(request("f-a"));
    ASSERT_TRUE(first.ok);
    EXPECT_EQ(first.detectedKind, DetectedKind::Image);
    EXPECT_EQ(resources.liveCount(), 1u);

    PreviewResult second = orchestrator->open(request("f-b"));
    ASSERT_TRUE(second.ok);
    EXPECT_FALSE(resources.isLive(first.payload.resource));
    EXPECT_TRUE(resources.isLive(second.payload.resource));
    EXPECT_EQ(resources.liveCount(), 1u);

    std::vector<std::pair<std::string, std::string>> trail;
    for (const auto& e : audit.events) trail.emplace_back(e.type, e.fileId);

    std::vector<std::pair<std::string, std::string>> expected = {
        {"requested", "f-a"}, {"decrypted", "f-a"}, {"classified", "f-a"},
        {"released", "f-a"},
        {"requested", "f-b"}, {"decrypted", "f-b"}, {"classified", "f-b"},
    };
    EXPECT_EQ(trail, expected);
    EXPECT_EQ(audit.events[3].detail, "superseded");
}

TEST_F(PreviewOrchestratorTest, WrongProofIsAccessDenied) {
    put("f-a", "a.txt", "text/plain", bytesOf("secret"));
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-a", "guess"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorCode::AccessDenied);
    EXPECT_TRUE(result.payload.text.empty());
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Errored);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "errored:AccessDenied"}));
}

TEST_F(PreviewOrchestratorTest, EveryOpenAsksTheGate) {
    put("f-a", "a.txt", "text/plain", bytesOf("one"));
    auto orchestrator = makeOrchestrator();

    ASSERT_TRUE(orchestrator->open(request("f-a")).ok);
    ASSERT_TRUE(orchestrator->open(request("f-a")).ok);
    EXPECT_EQ(gate.calls, 2);
}

TEST_F(PreviewOrchestratorTest, TamperedBodyIsDecryptionFailed) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 content"));
    store.at("f-a").blob.ciphertext[3] ^= 0x40;
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-a"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorCode::DecryptionFailed);
    EXPECT_EQ(result.cause, ErrorCode::AuthenticationFailed);
    EXPECT_FALSE(result.payload.resource.valid());
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types().back(), "errored:DecryptionFailed");
    EXPECT_EQ(audit.events.back().detail, "AuthenticationFailed");
}

TEST_F(PreviewOrchestratorTest, TruncatedBodyIsDecryptionFailed) {
    put("f-a", "a.bin", "", patternBytes(100));
    store.at("f-a").blob.ciphertext.resize(10);
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-a"));
    EXPECT_EQ(result.error, ErrorCode::DecryptionFailed);
    EXPECT_EQ(result.cause, ErrorCode::TruncatedInput);
}

TEST_F(PreviewOrchestratorTest, MalformedIdentifierIsInvalidKeyMaterial) {
    put("f-a", "a.txt", "text/plain", bytesOf("x"));
    auto orchestrator = makeOrchestrator();

    PreviewRequest r = request("f-a");
    r.stableUserId = "";
    PreviewResult result = orchestrator->open(r);
    EXPECT_EQ(result.error, ErrorCode::InvalidKeyMaterial);
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Errored);
}

TEST_F(PreviewOrchestratorTest, OtherUsersFileDoesNotOpen) {
    put("f-a", "a.txt", "text/plain", bytesOf("mine"));
    auto orchestrator = makeOrchestrator();

    PreviewRequest r = request("f-a");
    r.stableUserId = "user-456";
    PreviewResult result = orchestrator->open(r);
    EXPECT_EQ(result.error, ErrorCode::DecryptionFailed);
    EXPECT_EQ(result.cause, ErrorCode::AuthenticationFailed);
}

TEST_F(PreviewOrchestratorTest, MissingFileIsFetchFailed) {
    auto orchestrator = makeOrchestrator();
    PreviewResult result = orchestrator->open(request("nope"));
    EXPECT_EQ(result.error, ErrorCode::FetchFailed);
    EXPECT_EQ(audit.types().back(), "errored:FetchFailed");
}

TEST_F(PreviewOrchestratorTest, CloseWhileRequestingAbandonsTheRequest) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 content"));
    auto orchestrator = makeOrchestrator();

    gate.onRequest = [&](const std::string&) {
        EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Requesting);
        orchestrator->close();
    };

    PreviewResult result = orchestrator->open(request("f-a"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorCode::Cancelled);
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Released);
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "released"}));
    EXPECT_EQ(audit.events.back().detail, "cancelled");
}

TEST_F(PreviewOrchestratorTest, CancelDuringFetchDropsTheResult) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 content"));
    auto orchestrator = makeOrchestrator();

    store.onFetchBlob = [&](const std::string&) { orchestrator->cancel(); };

    PreviewResult result = orchestrator->open(request("f-a"));
    EXPECT_EQ(result.error, ErrorCode::Cancelled);
    EXPECT_FALSE(result.payload.resource.valid());
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Released);
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "released"}));
}

TEST_F(PreviewOrchestratorTest, CloseAfterBodyDecryptsDropsThePlaintext) {
    std::vector<unsigned char> body = bytesOf("%PDF-1.4\n");
    std::vector<unsigned char> rest = patternBytes(3 * VAULTLINE_DEFAULT_CHUNK_SIZE);
    body.insert(body.end(), rest.begin(), rest.end());
    put("f-a", "a.pdf", "application/pdf", body);
    auto orchestrator = makeOrchestrator();

    PreviewRequest r = request("f-a");
    int reports = 0;
    r.onProgress = [&](const Progress& p) {
        reports++;
        EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Decrypting);
        if (p.processed == p.total) orchestrator->close();
    };

    PreviewResult result = orchestrator->open(r);
    EXPECT_EQ(reports, 4);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorCode::Cancelled);
    EXPECT_FALSE(result.payload.resource.valid());
    EXPECT_EQ(result.payload.decryptedSize, 0u);
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Released);
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "released"}));
    EXPECT_EQ(audit.events.back().detail, "cancelled");
}

TEST_F(PreviewOrchestratorTest, CancelMidDecryptDropsTheResult) {
    put("f-a", "a.txt", "text/plain", bytesOf(std::string(2 * VAULTLINE_DEFAULT_CHUNK_SIZE + 10, 'x')));
    auto orchestrator = makeOrchestrator();

    PreviewRequest r = request("f-a");
    int reports = 0;
    r.onProgress = [&](const Progress&) {
        if (++reports == 1) orchestrator->cancel();
    };

    PreviewResult result = orchestrator->open(r);
    EXPECT_EQ(reports, 3);
    EXPECT_EQ(result.error, ErrorCode::Cancelled);
    EXPECT_TRUE(result.payload.text.empty());
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Released);
    EXPECT_EQ(audit.types(), (std::vector<std::string>{"requested", "released"}));
}

TEST_F(PreviewOrchestratorTest, NewOpenAfterDecryptNeverOverlapsHandles) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 first"));
    put("f-b", "b.png", "image/png", {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00});
    auto orchestrator = makeOrchestrator();

    PreviewResult second;
    PreviewRequest r = request("f-a");
    r.onProgress = [&](const Progress&) { second = orchestrator->open(request("f-b")); };

    PreviewResult first = orchestrator->open(r);
    EXPECT_EQ(first.error, ErrorCode::Cancelled);
    EXPECT_FALSE(first.payload.resource.valid());
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(second.detectedKind, DetectedKind::Image);

    EXPECT_EQ(resources.liveCount(), 1u);
    EXPECT_EQ(orchestrator->liveHandle().id, second.payload.resource.id);
    EXPECT_EQ(audit.types(),
              (std::vector<std::string>{"requested", "released", "requested", "decrypted", "classified"}));

    // The superseded request never registered a resource of its own
    ResourceHandle next = resources.create(bytesOf("x"), DetectedKind::Binary);
    EXPECT_EQ(next.id, std::string(VAULTLINE_HANDLE_PREFIX) + "2");
    EXPECT_EQ(resources.revoke(next), ErrorCode::None);
}

TEST_F(PreviewOrchestratorTest, CancelLeavesRenderedPreviewAlone) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 content"));
    auto orchestrator = makeOrchestrator();
    PreviewResult result = orchestrator->open(request("f-a"));
    ASSERT_TRUE(result.ok);

    orchestrator->cancel();
    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Rendered);
    EXPECT_TRUE(resources.isLive(result.payload.resource));
}

TEST_F(PreviewOrchestratorTest, NewOpenDuringRequestingSupersedesIt) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 first"));
    put("f-b", "b.pdf", "application/pdf", bytesOf("%PDF-1.4 second"));
    auto orchestrator = makeOrchestrator();

    PreviewResult second;
    gate.onRequest = [&](const std::string& fileId) {
        if (fileId != "f-a") return;
        second = orchestrator->open(request("f-b"));
    };

    PreviewResult first = orchestrator->open(request("f-a"));
    EXPECT_EQ(first.error, ErrorCode::Cancelled);
    ASSERT_TRUE(second.ok);

    EXPECT_EQ(orchestrator->state(), PreviewOrchestrator::State::Rendered);
    EXPECT_EQ(orchestrator->liveHandle().id, second.payload.resource.id);
    EXPECT_EQ(resources.liveCount(), 1u);
    EXPECT_EQ(firstBytes(second.payload.resource, 15), "%PDF-1.4 second");
}

TEST_F(PreviewOrchestratorTest, ConcurrentCloseNeverLeaksHandles) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4 content"));
    auto orchestrator = makeOrchestrator();

    std::atomic<bool> done{false};
    std::thread closer([&]() {
        while (!done) {
            orchestrator->close();
            if (resources.liveCount() > 1) ADD_FAILURE() << "more than one live handle";
            std::this_thread::yield();
        }
    });

    for (int i = 0; i < 20; ++i) {
        PreviewResult result = orchestrator->open(request("f-a"));
        EXPECT_TRUE(result.ok || result.error == ErrorCode::Cancelled) << errorCodeName(result.error);
    }
    done = true;
    closer.join();

    orchestrator->close();
    EXPECT_EQ(resources.liveCount(), 0u);
}

TEST_F(PreviewOrchestratorTest, CloseIsIdempotent) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4"));
    auto orchestrator = makeOrchestrator();
    ASSERT_TRUE(orchestrator->open(request("f-a")).ok);

    orchestrator->close();
    size_t count = audit.events.size();
    orchestrator->close();
    EXPECT_EQ(audit.events.size(), count);
}

TEST_F(PreviewOrchestratorTest, DestructionReleasesLiveHandle) {
    put("f-a", "a.pdf", "application/pdf", bytesOf("%PDF-1.4"));
    {
        auto orchestrator = makeOrchestrator();
        ASSERT_TRUE(orchestrator->open(request("f-a")).ok);
        EXPECT_EQ(resources.liveCount(), 1u);
    }
    EXPECT_EQ(resources.liveCount(), 0u);
    EXPECT_EQ(audit.types().back(), "released");
}

TEST_F(PreviewOrchestratorTest, UnknownBytesFallBackToBinary) {
    put("f-a", "blob.dat", "image/png", patternBytes(2048, 99));
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-a"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.detectedKind, DetectedKind::Binary);
    EXPECT_TRUE(result.payload.resource.valid());
}

TEST_F(PreviewOrchestratorTest, EmptyFileIsBinary) {
    put("f-a", "empty", "text/plain", {});
    auto orchestrator = makeOrchestrator();

    PreviewResult result = orchestrator->open(request("f-a"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.detectedKind, DetectedKind::Binary);
    EXPECT_EQ(result.payload.decryptedSize, 0u);
}

TEST_F(PreviewOrchestratorTest, AuditTrailCarriesNoSecrets) {
    put("f-a", "tax-return-2025.pdf", "application/pdf", bytesOf("%PDF-1.4 confidential"));
    auto orchestrator = makeOrchestrator();
    ASSERT_TRUE(orchestrator->open(request("f-a")).ok);
    orchestrator->close();

    for (const auto& e : audit.events) {
        std::string line = e.toJson().dump();
        EXPECT_EQ(line.find("tax-return"), std::string::npos) << line;
        EXPECT_EQ(line.find("confidential"), std::string::npos) << line;
        EXPECT_EQ(line.find(kProof), std::string::npos) << line;
        EXPECT_EQ(line.find("grant-"), std::string::npos) << line;
    }
}

TEST(AuditEventTest, JsonShape) {
    AuditEvent e = AuditEvent::make("classified", "f-1", "pdf signature=pdf confidence=1.00");
    nlohmann::json j = e.toJson();
    EXPECT_EQ(j["event"].get<std::string>(), "classified");
    EXPECT_EQ(j["fileId"].get<std::string>(), "f-1");
    EXPECT_EQ(j["detail"].get<std::string>(), "pdf signature=pdf confidence=1.00");
    EXPECT_GT(j["timestamp"].get<long>(), 0);

    nlohmann::json bare = AuditEvent::make("requested", "f-1").toJson();
    EXPECT_FALSE(bare.contains("detail"));
}
