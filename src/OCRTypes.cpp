#include "OCRTypes.hpp"

#include <array>

namespace ocrblocks {

namespace {

const std::array<LayoutLabel, 16> ALL_LAYOUT_LABELS = {
    LayoutLabel::Title,          LayoutLabel::SectionHeader,
    LayoutLabel::Text,           LayoutLabel::Handwriting,
    LayoutLabel::TextInlineMath, LayoutLabel::ListItem,
    LayoutLabel::Form,           LayoutLabel::Table,
    LayoutLabel::Figure,         LayoutLabel::Picture,
    LayoutLabel::TableOfContents, LayoutLabel::Caption,
    LayoutLabel::Footnote,       LayoutLabel::PageFooter,
    LayoutLabel::PageHeader,     LayoutLabel::Formula};

} // namespace

std::string categoryIdString(CategoryId id) {
  switch (id) {
  case CategoryId::Title:
    return "title";
  case CategoryId::Heading:
    return "heading";
  case CategoryId::Epigraph:
    return "epigraph";
  case CategoryId::Attribution:
    return "attribution";
  case CategoryId::Body:
    return "body";
  case CategoryId::Caption:
    return "caption";
  case CategoryId::Header:
    return "header";
  case CategoryId::Footer:
    return "footer";
  }
  return "body";
}

std::string regionClassString(RegionClass region) {
  switch (region) {
  case RegionClass::Body:
    return "body";
  case RegionClass::Header:
    return "header";
  case RegionClass::Footer:
    return "footer";
  }
  return "body";
}

std::string layoutLabelString(LayoutLabel label) {
  switch (label) {
  case LayoutLabel::Title:
    return "Title";
  case LayoutLabel::SectionHeader:
    return "SectionHeader";
  case LayoutLabel::Text:
    return "Text";
  case LayoutLabel::Handwriting:
    return "Handwriting";
  case LayoutLabel::TextInlineMath:
    return "TextInlineMath";
  case LayoutLabel::ListItem:
    return "ListItem";
  case LayoutLabel::Form:
    return "Form";
  case LayoutLabel::Table:
    return "Table";
  case LayoutLabel::Figure:
    return "Figure";
  case LayoutLabel::Picture:
    return "Picture";
  case LayoutLabel::TableOfContents:
    return "TableOfContents";
  case LayoutLabel::Caption:
    return "Caption";
  case LayoutLabel::Footnote:
    return "Footnote";
  case LayoutLabel::PageFooter:
    return "PageFooter";
  case LayoutLabel::PageHeader:
    return "PageHeader";
  case LayoutLabel::Formula:
    return "Formula";
  }
  return "Text";
}

bool parseLayoutLabel(const std::string &name, LayoutLabel &label) {
  for (LayoutLabel candidate : ALL_LAYOUT_LABELS) {
    if (layoutLabelString(candidate) == name) {
      label = candidate;
      return true;
    }
  }
  return false;
}

} // namespace ocrblocks
