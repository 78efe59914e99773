#pragma once

/**
 * @file attest.hpp
 * @brief Binary provenance and privilege gating
 *
 * Every installed binary of a trust scope is a leaf of the scope's Merkle
 * tree, and every install, upgrade or uninstall appends one signed record
 * to the scope's provenance chain. Capabilities are granted only to
 * binaries whose signature chains to a trust anchor or to the local
 * machine key.
 */

#include "attest/certificate.hpp"
#include "attest/config.hpp"
#include "attest/core.hpp"
#include "attest/crypto.hpp"
#include "attest/identity.hpp"
#include "attest/json.hpp"
#include "attest/key_store.hpp"
#include "attest/merkle_tree.hpp"
#include "attest/orchestrator.hpp"
#include "attest/platform.hpp"
#include "attest/provenance_chain.hpp"
#include "attest/result.hpp"
#include "attest/scope.hpp"
#include "attest/types.hpp"
#include "attest/verifier.hpp"
