#include "transform/technique_registry.hpp"
#include "transform/techniques.hpp"
#include "security/sha256_digest.hpp"
#include "core/column_type.hpp"
#include "core/error.hpp"

#include <stdexcept>

namespace anonymizer {

TechniqueRegistry::TechniqueRegistry(std::shared_ptr<const IDigest> digest) {
    if (!digest) {
        digest = std::make_shared<Sha256Digest>();
    }

    techniques_[static_cast<size_t>(TechniqueKind::PSEUDONYM)] = std::make_unique<PseudonymTechnique>();
    techniques_[static_cast<size_t>(TechniqueKind::MASK)] = std::make_unique<MaskTechnique>();
    techniques_[static_cast<size_t>(TechniqueKind::HASH)] = std::make_unique<HashTechnique>(std::move(digest));
    techniques_[static_cast<size_t>(TechniqueKind::SHUFFLE)] = std::make_unique<ShuffleTechnique>();
    techniques_[static_cast<size_t>(TechniqueKind::GENERALIZE)] = std::make_unique<GeneralizeTechnique>();
    techniques_[static_cast<size_t>(TechniqueKind::NOISE)] = std::make_unique<NoiseTechnique>();
    techniques_[static_cast<size_t>(TechniqueKind::TOKENIZE)] = std::make_unique<TokenizeTechnique>();
}

TechniqueKind TechniqueRegistry::resolve(std::string_view name) {
    const auto kind = technique_from_string(name);
    if (!kind) {
        throw UnsupportedTechniqueError(std::string(name));
    }
    return *kind;
}

const ITechnique& TechniqueRegistry::get(TechniqueKind kind) const {
    const auto idx = static_cast<size_t>(kind);
    if (idx >= techniques_.size() || !techniques_[idx]) {
        throw std::out_of_range("Technique not registered");
    }
    return *techniques_[idx];
}

TechniqueOutput TechniqueRegistry::apply(std::string_view name, const Column& column, ParamMap params) const {
    return apply(resolve(name), column, std::move(params));
}

TechniqueOutput TechniqueRegistry::apply(TechniqueKind kind, const Column& column, ParamMap params) const {
    auto output = get(kind).apply(column, std::move(params));
    output.column.kind = infer_column_kind(output.column.cells);
    return output;
}

} // namespace anonymizer
