// ZKRANGE - Parameter and Proof File Formats Implementation
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include "zkrange/rangeproof/codec.h"
#include "zkrange/core/hex.h"
#include "zkrange/util/logging.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace zkrange {
namespace rangeproof {

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

/// Sequential reader over the lines of a proof or parameter file
class LineReader {
public:
    explicit LineReader(std::vector<std::string> lines) : lines_(std::move(lines)) {}

    bool NextScalar(const char* what, BigScalar& out) {
        if (pos_ >= lines_.size()) {
            error_ = std::string("unexpected end of input reading ") + what;
            return false;
        }
        auto value = BigScalar::FromHex(lines_[pos_]);
        if (!value) {
            error_ = "invalid hex for " + std::string(what) + " on line " +
                     std::to_string(pos_ + 1);
            return false;
        }
        out = *value;
        ++pos_;
        return true;
    }

    bool NextLength(const char* what, size_t& out) {
        if (pos_ >= lines_.size()) {
            error_ = std::string("unexpected end of input reading ") + what;
            return false;
        }
        std::string digits = TrimWhitespace(lines_[pos_]);
        if (digits.empty() || digits.size() > 9 ||
            digits.find_first_not_of("0123456789") != std::string::npos) {
            error_ = "invalid " + std::string(what) + " on line " + std::to_string(pos_ + 1);
            return false;
        }
        out = static_cast<size_t>(std::stoul(digits));
        ++pos_;
        if (out > Remaining()) {
            error_ = std::string(what) + " " + digits + " exceeds the " +
                     std::to_string(Remaining()) + " remaining lines";
            return false;
        }
        return true;
    }

    /// Lines not yet consumed
    size_t Remaining() const { return lines_.size() - pos_; }

    /// True if every remaining line is blank
    bool AtEnd() const {
        for (size_t i = pos_; i < lines_.size(); ++i) {
            if (!TrimWhitespace(lines_[i]).empty()) return false;
        }
        return true;
    }

    const std::string& Error() const { return error_; }
    void SetError(std::string error) { error_ = std::move(error); }

private:
    std::vector<std::string> lines_;
    size_t pos_{0};
    std::string error_;
};

bool ReadFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool WriteFile(const std::string& path, const std::string& content) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERROR(util::LogCategory::PROOF)
                << "Cannot create directory " << target.parent_path().string()
                << ": " << ec.message();
            return false;
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR(util::LogCategory::PROOF) << "Cannot open " << path << " for writing";
        return false;
    }
    file << content;
    file.flush();
    return static_cast<bool>(file);
}

} // anonymous namespace

// ============================================================================
// Public Parameters
// ============================================================================

std::optional<PublicParameters> ParseParametersText(const std::string& text) {
    LineReader reader(SplitLines(text));
    PublicParameters params;

    if (!reader.NextScalar("g", params.g) ||
        !reader.NextScalar("h", params.h) ||
        !reader.NextScalar("n", params.n)) {
        LOG_WARN(util::LogCategory::PROOF) << "Bad parameter text: " << reader.Error();
        return std::nullopt;
    }

    return params;
}

std::string FormatParametersText(const PublicParameters& params) {
    std::ostringstream oss;
    oss << params.g.ToHex() << "\n"
        << params.h.ToHex() << "\n"
        << params.n.ToHex() << "\n";
    return oss.str();
}

std::optional<PublicParameters> LoadParametersFile(const std::string& path) {
    std::string text;
    if (!ReadFile(path, text)) {
        LOG_WARN(util::LogCategory::PROOF) << "Cannot read parameter file " << path;
        return std::nullopt;
    }
    return ParseParametersText(text);
}

bool SaveParametersFile(const std::string& path, const PublicParameters& params) {
    return WriteFile(path, FormatParametersText(params));
}

// ============================================================================
// Proofs
// ============================================================================

std::optional<RangeProof> ParseProofText(const std::string& text) {
    LineReader reader(SplitLines(text));
    RangeProof proof;

    auto fail = [&reader]() -> std::optional<RangeProof> {
        LOG_WARN(util::LogCategory::PROOF) << "Bad proof text: " << reader.Error();
        return std::nullopt;
    };

    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        if (!reader.NextScalar(RangeProof::ScalarName(i), proof.ScalarAt(i))) {
            return fail();
        }
    }

    size_t lLen = 0;
    if (!reader.NextLength("L length", lLen)) return fail();
    if (lLen == 0) {
        reader.SetError("L length must be > 0");
        return fail();
    }
    for (size_t i = 0; i < lLen; ++i) {
        BigScalar v;
        if (!reader.NextScalar("L", v)) return fail();
        proof.ippL.push_back(v);
    }

    size_t rLen = 0;
    if (!reader.NextLength("R length", rLen)) return fail();
    if (rLen != lLen) {
        reader.SetError("L and R length mismatch");
        return fail();
    }
    for (size_t i = 0; i < rLen; ++i) {
        BigScalar v;
        if (!reader.NextScalar("R", v)) return fail();
        proof.ippR.push_back(v);
    }

    if (!reader.NextScalar("a", proof.ippA) || !reader.NextScalar("b", proof.ippB)) {
        return fail();
    }

    if (!reader.AtEnd()) {
        reader.SetError("trailing data after b");
        return fail();
    }

    return proof;
}

std::string FormatProofText(const RangeProof& proof) {
    std::ostringstream oss;
    for (size_t i = 0; i < PROOF_SCALAR_COUNT; ++i) {
        oss << proof.ScalarAt(i).ToHex() << "\n";
    }
    oss << proof.ippL.size() << "\n";
    for (const auto& v : proof.ippL) {
        oss << v.ToHex() << "\n";
    }
    oss << proof.ippR.size() << "\n";
    for (const auto& v : proof.ippR) {
        oss << v.ToHex() << "\n";
    }
    oss << proof.ippA.ToHex() << "\n"
        << proof.ippB.ToHex() << "\n";
    return oss.str();
}

std::optional<RangeProof> LoadProofFile(const std::string& path) {
    std::string text;
    if (!ReadFile(path, text)) {
        LOG_WARN(util::LogCategory::PROOF) << "Cannot read proof file " << path;
        return std::nullopt;
    }
    return ParseProofText(text);
}

bool SaveProofFile(const std::string& path, const RangeProof& proof) {
    return WriteFile(path, FormatProofText(proof));
}

} // namespace rangeproof
} // namespace zkrange
