#include "transform/technique.hpp"
#include "security/sha256_digest.hpp"

namespace anonymizer {

uint64_t ensure_seed(ParamMap& params) {
    if (const auto seed = params.find_int("seed")) {
        return static_cast<uint64_t>(*seed);
    }
    const uint32_t fresh = secure_random_seed();
    params.set("seed", static_cast<int64_t>(fresh));
    return fresh;
}

} // namespace anonymizer
