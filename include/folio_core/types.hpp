#pragma once

#include "folio_core/types/chunk.hpp"
#include "folio_core/types/content_kind.hpp"
#include "folio_core/types/page_record.hpp"
