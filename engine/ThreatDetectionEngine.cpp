#include "engine/ThreatDetectionEngine.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include "engine/BehaviorAnalyzer.hpp"
#include "engine/ExtensionAnalyzer.hpp"
#include "engine/StructureAnalyzer.hpp"
#include <future>
#include <set>

namespace filesentry {

namespace {

using AnalyzerOutput = std::vector<DetectedThreat>;

uint64_t ElapsedMillis(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace

ThreatDetectionEngine::ThreatDetectionEngine(DetectionConfig detection,
                                             LimitsConfig limits,
                                             SeverityWeights weights,
                                             RecommendationThresholds thresholds,
                                             ThreadPool* pool)
    : detection_(detection), limits_(limits), scorer_(weights, thresholds), pool_(pool) {
    BehaviorThresholds behavior{detection_.entropy_threshold, detection_.url_count_threshold};
    behavior_ = std::make_shared<BehaviorAnalyzer>(behavior, limits_.content_sample_bytes);
    extension_ = std::make_shared<ExtensionAnalyzer>();
    structure_ = std::make_shared<StructureAnalyzer>(detection_.header_tolerance);
}

void ThreatDetectionEngine::AddAnalyzer(std::shared_ptr<const ThreatAnalyzer> analyzer) {
    extra_.push_back(std::move(analyzer));
}

void ThreatDetectionEngine::CheckPreconditions(uint64_t size) const {
    if (!detection_.enable_malware_detection) {
        throw ScanError(ScanErrorCode::CONFIGURATION_DISABLED, "Malware detection is disabled");
    }
    if (size > limits_.max_scan_size) {
        throw ScanError(ScanErrorCode::SIZE_EXCEEDED,
                        "File size " + std::to_string(size) + " exceeds scan limit " +
                        std::to_string(limits_.max_scan_size));
    }
}

std::vector<std::shared_ptr<const ThreatAnalyzer>> ThreatDetectionEngine::AnalyzersFor(
    const std::shared_ptr<const ThreatIntelSnapshot>& intel) const {
    std::vector<std::shared_ptr<const ThreatAnalyzer>> analyzers;
    // Aliasing constructors keep the snapshot alive for as long as a task holds the matcher.
    if (intel && intel->hashes) {
        analyzers.push_back(std::shared_ptr<const ThreatAnalyzer>(intel, intel->hashes.get()));
    }
    if (intel && intel->signatures) {
        analyzers.push_back(std::shared_ptr<const ThreatAnalyzer>(intel, intel->signatures.get()));
    }
    if (detection_.enable_behavior_analysis) {
        analyzers.push_back(behavior_);
    }
    analyzers.push_back(extension_);
    analyzers.push_back(structure_);
    analyzers.insert(analyzers.end(), extra_.begin(), extra_.end());
    return analyzers;
}

ThreatDetectionResult ThreatDetectionEngine::Scan(const std::vector<uint8_t>& bytes,
                                                  const FileMetadata& metadata,
                                                  std::shared_ptr<const ThreatIntelSnapshot> intel) const {
    CheckPreconditions(bytes.size());
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(limits_.scan_timeout_ms);
    auto content = ScanContent::Create(bytes, metadata, limits_.content_sample_bytes);
    CancellationToken token;
    return Scan(std::move(content), std::move(intel), token, deadline);
}

ThreatDetectionResult ThreatDetectionEngine::Scan(std::shared_ptr<const ScanContent> content,
                                                  std::shared_ptr<const ThreatIntelSnapshot> intel,
                                                  const CancellationToken& token,
                                                  ScanDeadline deadline) const {
    auto start = std::chrono::steady_clock::now();
    CheckPreconditions(content->Bytes().size());

    ThreatDetectionResult result;
    result.file_id = content->Metadata().file_id;
    result.file_name = content->Metadata().file_name;
    result.scan_timestamp = NowMillis();
    result.engine_name = kEngineName;
    result.engine_version = kEngineVersion;
    result.intel_version = intel ? intel->version : "none";

    auto analyzers = AnalyzersFor(intel);

    // Fan out. Each task owns references to everything it reads, so tasks
    // abandoned after a timeout stay valid until they return.
    std::vector<std::future<AnalyzerOutput>> futures;
    futures.reserve(analyzers.size());
    for (const auto& analyzer : analyzers) {
        auto task = [analyzer, content, token]() {
            return analyzer->Analyze(*content, token);
        };
        if (pool_) {
            futures.push_back(pool_->Submit(token, task));
        } else {
            if (std::chrono::steady_clock::now() >= deadline) {
                token.Cancel();
                throw ScanError(ScanErrorCode::TIMEOUT,
                                "Threat detection exceeded " + std::to_string(limits_.scan_timeout_ms) + " ms");
            }
            std::promise<AnalyzerOutput> promise;
            try {
                promise.set_value(task());
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
            futures.push_back(promise.get_future());
        }
    }

    // Fan in, in analyzer order, under one deadline.
    std::set<std::string> seen_ids;
    for (size_t i = 0; i < futures.size(); ++i) {
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            token.Cancel();
            LOG_WARN("Scan of {} timed out waiting for analyzer {}",
                     result.file_id, analyzers[i]->Name());
            throw ScanError(ScanErrorCode::TIMEOUT,
                            "Threat detection exceeded " + std::to_string(limits_.scan_timeout_ms) +
                            " ms (analyzer " + analyzers[i]->Name() + ")");
        }

        try {
            for (auto& threat : futures[i].get()) {
                if (seen_ids.insert(threat.id).second) {
                    result.threats.push_back(std::move(threat));
                }
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("Analyzer {} failed on {}: {}", analyzers[i]->Name(), result.file_id, ex.what());
            result.diagnostics.push_back({analyzers[i]->Name(), ex.what()});
        } catch (...) {
            LOG_ERROR("Analyzer {} failed on {}: unknown exception", analyzers[i]->Name(), result.file_id);
            result.diagnostics.push_back({analyzers[i]->Name(), "unknown exception"});
        }
    }

    RiskAssessment assessment = scorer_.Assess(result.threats);
    result.risk_score = assessment.score;
    result.overall_severity = assessment.severity;
    result.recommendation = assessment.recommendation;
    result.scan_duration_ms = ElapsedMillis(start);

    LOG_DEBUG("Threat scan {}: {} threats, risk={}, severity={}, recommendation={} ({} ms)",
              result.file_id, result.threats.size(), result.risk_score,
              SeverityToString(result.overall_severity),
              RecommendationToString(result.recommendation), result.scan_duration_ms);
    return result;
}

} // namespace filesentry
