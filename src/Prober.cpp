// Prober.cpp
#include "Prober.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <mutex>

namespace Elixir {

Prober::Prober(Verifier verifier, std::size_t batchSize)
    : m_verifier(std::move(verifier)), m_batchSize(std::max<std::size_t>(1, batchSize)) {}

std::optional<std::string> Prober::probe(const std::vector<std::string>& candidates,
                                         const ProgressCallback& onProgress) const {
    if (candidates.empty()) return std::nullopt;

    const std::size_t total = candidates.size();
    std::size_t tested = 0;

    for (std::size_t begin = 0; begin < total; begin += m_batchSize) {
        const std::size_t end = std::min(total, begin + m_batchSize);

        std::mutex mutex;   // guards firstSuccess, tested, onProgress
        std::optional<std::string> firstSuccess;

        std::vector<std::future<void>> pending;
        pending.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            const std::string& candidate = candidates[i];
            pending.push_back(std::async(std::launch::async, [&, candidate]() {
                bool ok = false;
                try {
                    ok = m_verifier(candidate);
                } catch (const std::exception& e) {
                    std::cerr << "[Discovery] Verifier threw for " << candidate << ": " << e.what() << std::endl;
                }
                std::lock_guard<std::mutex> lock(mutex);
                ++tested;
                if (ok && !firstSuccess) firstSuccess = candidate;
                if (onProgress) onProgress(candidate, tested, total);
            }));
        }

        // Every probe in the batch settles before we look at the outcome.
        for (auto& f : pending) f.get();

        if (firstSuccess) return firstSuccess;
    }
    return std::nullopt;
}

} // namespace Elixir
