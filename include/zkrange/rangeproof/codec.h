// ZKRANGE - Parameter and Proof File Formats
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Line-oriented text formats shared with the prover tooling.
//
// Parameter file: three hex lines g, h, n.
//
// Proof file: one line per field:
//   15 scalar hex lines (A, S, T1, T2, tau_x, mu, t_hat, C, C_v1, C_v2,
//   t0, t1, t2, tau1, tau2), decimal len(L), L hex lines, decimal len(R),
//   R hex lines, a, b.
//
// Hex lines may carry a 0x prefix. Values wider than 256 bits are rejected.

#ifndef ZKRANGE_RANGEPROOF_CODEC_H
#define ZKRANGE_RANGEPROOF_CODEC_H

#include "zkrange/rangeproof/proof.h"

#include <optional>
#include <string>

namespace zkrange {
namespace rangeproof {

// ============================================================================
// Public Parameters
// ============================================================================

/// Parse parameter text (first three lines; later lines are ignored)
std::optional<PublicParameters> ParseParametersText(const std::string& text);

/// Format parameters as three hex lines
std::string FormatParametersText(const PublicParameters& params);

/// Load a parameter file; failures are logged and yield nullopt
std::optional<PublicParameters> LoadParametersFile(const std::string& path);

/// Write a parameter file, creating parent directories
bool SaveParametersFile(const std::string& path, const PublicParameters& params);

// ============================================================================
// Proofs
// ============================================================================

/// Parse proof text
std::optional<RangeProof> ParseProofText(const std::string& text);

/// Format a proof in the line format
std::string FormatProofText(const RangeProof& proof);

/// Load a proof file; failures are logged and yield nullopt
std::optional<RangeProof> LoadProofFile(const std::string& path);

/// Write a proof file, creating parent directories
bool SaveProofFile(const std::string& path, const RangeProof& proof);

} // namespace rangeproof
} // namespace zkrange

#endif // ZKRANGE_RANGEPROOF_CODEC_H
