#include "CategoryRegistry.hpp"

#include "TextShape.hpp"

#include <numeric>

namespace ocrblocks {

namespace {

Category makeCategory(CategoryId id, const char *name, const char *description,
                      const char *color, double fontSize, RegionClass region,
                      bool enabled) {
  Category category;
  category.id = id;
  category.name = name;
  category.description = description;
  category.color = color;
  category.fontSize = fontSize;
  category.region = region;
  category.enabled = enabled;
  return category;
}

CategoryTaxonomy buildTaxonomy() {
  CategoryTaxonomy taxonomy;
  const Category categories[] = {
      makeCategory(CategoryId::Title, "Titles",
                   "Chapter titles and main headings", "#e91e63", 24,
                   RegionClass::Body, true),
      makeCategory(CategoryId::Heading, "Section Headings",
                   "Section headings and subheadings", "#9c27b0", 18,
                   RegionClass::Body, true),
      makeCategory(CategoryId::Epigraph, "Epigraphs",
                   "Quotations, epigraphs and set-off formulas", "#00bcd4", 14,
                   RegionClass::Body, true),
      makeCategory(CategoryId::Attribution, "Attributions",
                   "Quote attributions introduced by a dash", "#607d8b", 12,
                   RegionClass::Body, true),
      makeCategory(CategoryId::Body, "Body Text", "Main body text content",
                   "#8bc34a", 12, RegionClass::Body, true),
      makeCategory(CategoryId::Caption, "Captions",
                   "Image captions and figure descriptions", "#ff9800", 10,
                   RegionClass::Body, true),
      makeCategory(CategoryId::Header, "Page Headers",
                   "Page headers and running heads", "#795548", 10,
                   RegionClass::Header, false),
      makeCategory(CategoryId::Footer, "Page Footers",
                   "Page footers and page numbers", "#9e9e9e", 10,
                   RegionClass::Footer, false),
  };
  for (const auto &category : categories) {
    taxonomy.emplace(category.id, category);
  }
  return taxonomy;
}

} // namespace

const CategoryTaxonomy &categoryTaxonomy() {
  static const CategoryTaxonomy taxonomy = buildTaxonomy();
  return taxonomy;
}

RegionClass regionClassFor(CategoryId id) {
  const CategoryTaxonomy &taxonomy = categoryTaxonomy();
  auto it = taxonomy.find(id);
  return it != taxonomy.end() ? it->second.region : RegionClass::Body;
}

std::map<CategoryId, Category>
aggregateCategories(const std::vector<TextBlock> &blocks,
                    const CategoryTaxonomy &taxonomy) {
  using CategoryMap = std::map<CategoryId, Category>;

  return std::accumulate(
      blocks.begin(), blocks.end(), CategoryMap(),
      [&taxonomy](CategoryMap categories, const TextBlock &block) {
        auto it = categories.find(block.category);
        if (it == categories.end()) {
          auto base = taxonomy.find(block.category);
          if (base == taxonomy.end()) {
            return categories;
          }
          Category category = base->second;
          category.blockCount = 0;
          category.charCount = 0;
          category.sampleText = utf8Prefix(block.text, SAMPLE_TEXT_LENGTH);
          it = categories.emplace(block.category, category).first;
        }
        it->second.blockCount++;
        it->second.charCount += block.charCount;
        return categories;
      });
}

} // namespace ocrblocks
