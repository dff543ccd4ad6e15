#pragma once

#include <nlohmann/json.hpp>

#include "folio_core/db/chunk_store.hpp"
#include "folio_core/types.hpp"

namespace folio_core {

// nlohmann::json conversions, found through ADL.

void to_json(nlohmann::json& j, const BoundingBox& bbox);
void from_json(const nlohmann::json& j, BoundingBox& bbox);

void to_json(nlohmann::json& j, const PageImage& image);
void from_json(const nlohmann::json& j, PageImage& image);

void to_json(nlohmann::json& j, const PageTable& table);
void from_json(const nlohmann::json& j, PageTable& table);

void to_json(nlohmann::json& j, const TextBlock& block);
void from_json(const nlohmann::json& j, TextBlock& block);

void to_json(nlohmann::json& j, const EquationData& equation);
void from_json(const nlohmann::json& j, EquationData& equation);

void to_json(nlohmann::json& j, const StructuralContext& context);

void to_json(nlohmann::json& j, const Chunk& chunk);

void to_json(nlohmann::json& j, const RetrievalResult& result);

void to_json(nlohmann::json& j, const DocumentSummary& summary);

void to_json(nlohmann::json& j, const PageRecord& page);

/**
 * @brief Decodes a page leniently.
 *
 * Missing or mistyped fields become empty text or no media; media entries
 * that are not objects are skipped. Never throws for malformed fields.
 */
PageRecord page_record_from_json(const nlohmann::json& j);

// Media and equation payload stored beside a chunk's text.
nlohmann::json chunk_payload_to_json(const Chunk& chunk);
void chunk_payload_from_json(const nlohmann::json& j, Chunk& chunk);

}  // namespace folio_core
