#pragma once
#include <functional>
#include <string>
#include <vector>

namespace Wake {

/// KeywordEngine
/// Streaming keyword-spotting inference seen as a black box: it pulls
/// audio itself and reports one probability per configured keyword.
class KeywordEngine {
public:
    // probabilities[i] belongs to keyword i
    using ProbabilityCallback = std::function<void(const std::vector<float>& probabilities)>;

    virtual ~KeywordEngine() = default;

    /// Load model and open audio. False (with err) is fatal for the caller.
    virtual bool init(const ProbabilityCallback& callback, std::string* err) = 0;

    /// Acquire one frame and advance inference. Blocks only inside frame
    /// acquisition. Returns frames consumed, or < 0 when this step failed.
    virtual int run() = 0;

    /// Release audio/model resources.
    virtual void shutdown() = 0;
};

} // namespace Wake
