// Prober.hpp
// Runs verification over the candidate list in fixed-size concurrent batches
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Elixir {

class Prober {
public:
    using Verifier = std::function<bool(const std::string& candidate)>;
    // Called once per settled candidate, serialized: (candidate, tested so far, total).
    using ProgressCallback = std::function<void(const std::string& candidate, std::size_t tested, std::size_t total)>;

    Prober(Verifier verifier, std::size_t batchSize);

    // First candidate observed to verify, or nullopt once the list is exhausted.
    // Batches run strictly in order; a batch is always fully awaited, and no
    // later batch starts after one produced a success.
    std::optional<std::string> probe(const std::vector<std::string>& candidates,
                                     const ProgressCallback& onProgress = nullptr) const;

    std::size_t batchSize() const { return m_batchSize; }

private:
    Verifier m_verifier;
    std::size_t m_batchSize;
};

} // namespace Elixir
