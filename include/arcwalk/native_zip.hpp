#pragma once

#include "arcwalk/strategy.hpp"

namespace arcwalk::strategy {

// In-process ZIP through zip::Writer. Always available; used when no external
// compressor is installed or when native output is forced.
class NativeZipStrategy : public ArchiveStrategy {
public:
    void Create(const walk::TreeWalker& walker,
                const Config& config,
                const std::filesystem::path& output) override;

    ArchiveFormat Format() const override { return ArchiveFormat::Zip; }
    std::string Name() const override { return "native-zip"; }
};

}  // namespace arcwalk::strategy
