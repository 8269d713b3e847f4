#include "../src/core/status.hpp"

int main() {
    using mpng::ProbeResult;
    using mpng::Status;
    using mpng::classify;
    if (classify(ProbeResult::failure("timeout"), 200) != Status::Down) return 1;
    // a failed probe is Down whatever latency it carries
    ProbeResult odd{false, 5.0, "refused"};
    if (classify(odd, 200) != Status::Down) return 2;
    if (classify(ProbeResult::success(50), 200) != Status::Up) return 3;
    if (classify(ProbeResult::success(199.9), 200) != Status::Up) return 4;
    if (classify(ProbeResult::success(200), 200) != Status::Slow) return 5;
    if (classify(ProbeResult::success(750), 200) != Status::Slow) return 6;
    ProbeResult no_latency{true, std::nullopt, ""};
    if (classify(no_latency, 200) != Status::Up) return 7;
    return 0;
}
