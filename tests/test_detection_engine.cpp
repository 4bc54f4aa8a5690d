#include <gtest/gtest.h>
#include "engine/ThreatDetectionEngine.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace filesentry;

namespace {

const char* kEicar = "X5O!P%@AP[4\\PZX54(P^)7CC)7}$EICAR-STANDARD-ANTIVIRUS-TEST-FILE!$H+H*";

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

FileMetadata Metadata(const std::string& name = "notes.txt") {
    FileMetadata metadata;
    metadata.file_id = "file-42";
    metadata.file_name = name;
    metadata.mime_type = "text/plain";
    return metadata;
}

// Waits until cancelled, up to a safety bound.
class SlowAnalyzer : public ThreatAnalyzer {
public:
    explicit SlowAnalyzer(std::shared_ptr<std::atomic<bool>> saw_cancel) : saw_cancel_(std::move(saw_cancel)) {}

    std::string Name() const override { return "slow"; }
    std::vector<DetectedThreat> Analyze(const ScanContent&, const CancellationToken& token) const override {
        auto limit = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!token.IsCancelled() && std::chrono::steady_clock::now() < limit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        saw_cancel_->store(token.IsCancelled());
        return {};
    }

private:
    std::shared_ptr<std::atomic<bool>> saw_cancel_;
};

class FailingAnalyzer : public ThreatAnalyzer {
public:
    std::string Name() const override { return "broken"; }
    std::vector<DetectedThreat> Analyze(const ScanContent&, const CancellationToken&) const override {
        throw std::runtime_error("analyzer exploded");
    }
};

class NonStandardThrowAnalyzer : public ThreatAnalyzer {
public:
    std::string Name() const override { return "plugin"; }
    std::vector<DetectedThreat> Analyze(const ScanContent&, const CancellationToken&) const override {
        throw 42;
    }
};

// Reports the same id as a built-in analyzer would for an executable name.
class DuplicateAnalyzer : public ThreatAnalyzer {
public:
    std::string Name() const override { return "duplicate"; }
    std::vector<DetectedThreat> Analyze(const ScanContent&, const CancellationToken&) const override {
        DetectedThreat threat;
        threat.id = "ext_.exe";
        threat.signature.id = "dup";
        threat.signature.severity = Severity::LOW;
        threat.confidence = 10;
        return {threat};
    }
};

} // namespace

class DetectionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
        intel_ = CompileSnapshot(DefaultThreatIntel());
    }

    void TearDown() override {
        pool_->Shutdown();
    }

    ThreatDetectionEngine MakeEngine(DetectionConfig detection = {}, LimitsConfig limits = {}) {
        return ThreatDetectionEngine(detection, limits, SeverityWeights{}, RecommendationThresholds{},
                                     pool_.get());
    }

    std::unique_ptr<ThreadPool> pool_;
    std::shared_ptr<const ThreatIntelSnapshot> intel_;
};

TEST_F(DetectionEngineTest, CleanFileIsAllowed) {
    auto engine = MakeEngine();
    auto result = engine.Scan(Bytes("Meeting notes for the quarterly review."), Metadata(), intel_);

    EXPECT_TRUE(result.threats.empty());
    EXPECT_EQ(result.risk_score, 0u);
    EXPECT_EQ(result.overall_severity, Severity::INFO);
    EXPECT_EQ(result.recommendation, Recommendation::ALLOW);
    EXPECT_EQ(result.file_id, "file-42");
    EXPECT_EQ(result.engine_name, ThreatDetectionEngine::kEngineName);
    EXPECT_EQ(result.intel_version, "builtin-1.0.0");
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(DetectionEngineTest, EicarIsBlocked) {
    auto engine = MakeEngine();
    auto result = engine.Scan(Bytes(kEicar), Metadata("eicar.com.txt"), intel_);

    EXPECT_EQ(result.risk_score, 100u);
    EXPECT_EQ(result.overall_severity, Severity::CRITICAL);
    EXPECT_EQ(result.recommendation, Recommendation::BLOCK);
    auto hash_hits = std::count_if(result.threats.begin(), result.threats.end(), [](const DetectedThreat& t) {
        return t.signature.id.rfind("mal_hash_", 0) == 0;
    });
    EXPECT_EQ(hash_hits, 2);
}

TEST_F(DetectionEngineTest, ObfuscatedScriptIsBlocked) {
    auto engine = MakeEngine();
    auto result = engine.Scan(Bytes("eval(atob(payload)); setWindowsHook(handler);"), Metadata("page.txt"), intel_);

    auto has = [&](const std::string& signature_id) {
        return std::any_of(result.threats.begin(), result.threats.end(),
                           [&](const DetectedThreat& t) { return t.signature.id == signature_id; });
    };
    EXPECT_TRUE(has("mal_001"));
    EXPECT_TRUE(has("mal_010"));
    EXPECT_TRUE(has("mal_007"));
    EXPECT_TRUE(has("behavior_suspicious_api_calls"));
    EXPECT_EQ(result.overall_severity, Severity::CRITICAL);
    EXPECT_EQ(result.recommendation, Recommendation::BLOCK);
}

TEST_F(DetectionEngineTest, SizeLimitIsEnforced) {
    LimitsConfig limits;
    limits.max_scan_size = 16;
    auto engine = MakeEngine(DetectionConfig{}, limits);
    try {
        engine.Scan(Bytes(std::string(17, 'a')), Metadata(), intel_);
        FAIL() << "expected ScanError";
    } catch (const ScanError& ex) {
        EXPECT_EQ(ex.code(), ScanErrorCode::SIZE_EXCEEDED);
        EXPECT_FALSE(ex.retryable());
    }
    EXPECT_NO_THROW(engine.Scan(Bytes(std::string(16, 'a')), Metadata(), intel_));
}

TEST_F(DetectionEngineTest, DisabledDetectionIsRejected) {
    DetectionConfig detection;
    detection.enable_malware_detection = false;
    auto engine = MakeEngine(detection);
    try {
        engine.Scan(Bytes("x"), Metadata(), intel_);
        FAIL() << "expected ScanError";
    } catch (const ScanError& ex) {
        EXPECT_EQ(ex.code(), ScanErrorCode::CONFIGURATION_DISABLED);
    }
}

TEST_F(DetectionEngineTest, BehaviorAnalysisCanBeDisabled) {
    DetectionConfig detection;
    detection.enable_behavior_analysis = false;
    auto engine = MakeEngine(detection);
    auto result = engine.Scan(Bytes("VirtualAlloc(0, 4096)"), Metadata(), intel_);
    EXPECT_TRUE(result.threats.empty());
}

TEST_F(DetectionEngineTest, TimeoutCancelsOutstandingAnalyzers) {
    LimitsConfig limits;
    limits.scan_timeout_ms = 50;
    auto engine = MakeEngine(DetectionConfig{}, limits);
    auto saw_cancel = std::make_shared<std::atomic<bool>>(false);
    engine.AddAnalyzer(std::make_shared<SlowAnalyzer>(saw_cancel));

    try {
        engine.Scan(Bytes("text"), Metadata(), intel_);
        FAIL() << "expected ScanError";
    } catch (const ScanError& ex) {
        EXPECT_EQ(ex.code(), ScanErrorCode::TIMEOUT);
        EXPECT_TRUE(ex.retryable());
    }

    pool_->Shutdown();
    EXPECT_TRUE(saw_cancel->load());
}

TEST_F(DetectionEngineTest, AnalyzerFailureBecomesDiagnostic) {
    auto engine = MakeEngine();
    engine.AddAnalyzer(std::make_shared<FailingAnalyzer>());

    auto result = engine.Scan(Bytes("eval(x)"), Metadata(), intel_);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].analyzer, "broken");
    EXPECT_EQ(result.diagnostics[0].message, "analyzer exploded");
    EXPECT_FALSE(result.threats.empty());
}

TEST_F(DetectionEngineTest, DuplicateThreatIdsKeepFirst) {
    auto engine = MakeEngine();
    engine.AddAnalyzer(std::make_shared<DuplicateAnalyzer>());

    auto result = engine.Scan(Bytes("x"), Metadata("tool.exe"), intel_);
    auto count = std::count_if(result.threats.begin(), result.threats.end(),
                               [](const DetectedThreat& t) { return t.id == "ext_.exe"; });
    EXPECT_EQ(count, 1);
    auto it = std::find_if(result.threats.begin(), result.threats.end(),
                           [](const DetectedThreat& t) { return t.id == "ext_.exe"; });
    EXPECT_EQ(it->signature.id, "ext_.exe");
}

TEST_F(DetectionEngineTest, RunsInlineWithoutPool) {
    ThreatDetectionEngine engine(DetectionConfig{}, LimitsConfig{}, SeverityWeights{},
                                 RecommendationThresholds{}, nullptr);
    auto result = engine.Scan(Bytes(kEicar), Metadata(), intel_);
    EXPECT_EQ(result.recommendation, Recommendation::BLOCK);
}

TEST_F(DetectionEngineTest, ScansWithoutIntel) {
    auto engine = MakeEngine();
    auto result = engine.Scan(Bytes(kEicar), Metadata(), nullptr);
    EXPECT_EQ(result.intel_version, "none");
    EXPECT_TRUE(result.threats.empty());
}

TEST_F(DetectionEngineTest, NonStandardExceptionBecomesDiagnostic) {
    auto pooled = MakeEngine();
    pooled.AddAnalyzer(std::make_shared<NonStandardThrowAnalyzer>());
    auto result = pooled.Scan(Bytes("eval(x)"), Metadata(), intel_);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].analyzer, "plugin");
    EXPECT_EQ(result.diagnostics[0].message, "unknown exception");
    EXPECT_FALSE(result.threats.empty());

    ThreatDetectionEngine inline_engine(DetectionConfig{}, LimitsConfig{}, SeverityWeights{},
                                        RecommendationThresholds{}, nullptr);
    inline_engine.AddAnalyzer(std::make_shared<NonStandardThrowAnalyzer>());
    auto inline_result = inline_engine.Scan(Bytes("eval(x)"), Metadata(), intel_);
    ASSERT_EQ(inline_result.diagnostics.size(), 1u);
    EXPECT_EQ(inline_result.diagnostics[0].message, "unknown exception");
}
