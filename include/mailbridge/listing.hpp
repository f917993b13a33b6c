#pragma once
#include <vector>
#include <mailbridge/defs.h>
#include <mailbridge/mapidefs.h>
#include <mailbridge/records.hpp>
#include <mailbridge/store.hpp>

namespace mailbridge {

/* Upper limit on rows fetched per store round-trip */
static constexpr unsigned int LIST_BATCH_MAX = 50;

/**
 * Produce at most @limit summaries of the items in @folder, most
 * recently delivered first, fetching rows in batches of @batch_size
 * (clamped to 1..LIST_BATCH_MAX). If @res is given, only matching
 * items are considered. Setup failures yield an empty list.
 */
extern MB_EXPORT std::vector<message_summary> list_messages(folder_object &folder,
	int limit, unsigned int batch_size, const RESTRICTION *res = nullptr);
/* Summary columns in the order they are projected */
extern MB_EXPORT const PROPTAG_ARRAY &summary_columns();
extern MB_EXPORT bool summary_from_row(const TPROPVAL_ARRAY &, message_summary &);

}
