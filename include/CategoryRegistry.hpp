#ifndef OCRBLOCKS_CATEGORY_REGISTRY_HPP
#define OCRBLOCKS_CATEGORY_REGISTRY_HPP

#include "OCRTypes.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace ocrblocks {

/// Category metadata keyed by id, with zeroed run statistics
using CategoryTaxonomy = std::map<CategoryId, Category>;

/// Characters of the first block kept as a category's sample text
const std::size_t SAMPLE_TEXT_LENGTH = 100;

/**
 * @brief The fixed set of eight categories with their display metadata
 *
 * Built once and never modified. Header and footer are disabled by
 * default; all other categories are enabled.
 */
const CategoryTaxonomy &categoryTaxonomy();

/**
 * @brief Region class a category's blocks belong to
 */
RegionClass regionClassFor(CategoryId id);

/**
 * @brief Fold categorized blocks into per-category statistics
 *
 * Produces a new map holding, for each category with at least one block,
 * the taxonomy metadata plus block count, character count and the first
 * 100 characters of the first block in document order.
 *
 * @param blocks Categorized blocks in document order
 * @param taxonomy Category metadata to copy from
 * @return Populated categories; unused categories are omitted
 */
std::map<CategoryId, Category>
aggregateCategories(const std::vector<TextBlock> &blocks,
                    const CategoryTaxonomy &taxonomy);

} // namespace ocrblocks

#endif // OCRBLOCKS_CATEGORY_REGISTRY_HPP
