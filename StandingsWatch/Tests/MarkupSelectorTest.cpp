#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Extract/MarkupSelector.h"

namespace {

// Parsed document kept alive together with its buffer.
class Document {
public:
    explicit Document(const std::string& xml)
        : buffer_(xml.begin(), xml.end())
    {
        buffer_.push_back('\0');
        doc_.parse<0>(buffer_.data());
    }

    const MarkupSelector::Node* root() const { return &doc_; }

private:
    std::vector<char> buffer_;
    rapidxml::xml_document<> doc_;
};

const char* kMarkup =
    "<div class=\"table standings\">"
    "  <div class=\"row\" aria-label=\"view standings for alpha\" data-index=\"0\">"
    "    <span class=\"name\">alpha</span>"
    "    <div class=\"points\"><div role=\"cell\"><span>1,204.5</span> <span>FPTS</span></div></div>"
    "  </div>"
    "  <div class=\"row selected\" aria-label=\"view standings for beta\" data-index=\"1\">"
    "    <span class=\"name\">beta</span>"
    "    <div class=\"points\"><span>88</span></div>"
    "  </div>"
    "</div>";

}

TEST(MarkupSelectorTest, ParsesCompoundsAndRejectsMalformedText)
{
    EXPECT_NO_THROW(MarkupSelector::parse("div.row.selected [role=\"cell\"] span"));
    EXPECT_NO_THROW(MarkupSelector::parse("*[data-index='1']"));
    EXPECT_TRUE(MarkupSelector::parse("   ").empty());

    EXPECT_THROW(MarkupSelector::parse("div > span"), std::invalid_argument);
    EXPECT_THROW(MarkupSelector::parse("[role=\"cell\""), std::invalid_argument);
    EXPECT_THROW(MarkupSelector::parse(".row."), std::invalid_argument);
    EXPECT_THROW(MarkupSelector::parse("a:hover"), std::invalid_argument);
}

TEST(MarkupSelectorTest, SelectsByClassTokensNotSubstrings)
{
    Document doc(kMarkup);
    EXPECT_EQ(2u, MarkupSelector::parse(".row").selectAll(doc.root()).size());
    EXPECT_EQ(1u, MarkupSelector::parse(".row.selected").selectAll(doc.root()).size());
    EXPECT_TRUE(MarkupSelector::parse(".ro").selectAll(doc.root()).empty());
    EXPECT_EQ(1u, MarkupSelector::parse("div.table.standings").selectAll(doc.root()).size());
}

TEST(MarkupSelectorTest, AttributeTestsMatchPresenceAndExactValue)
{
    Document doc(kMarkup);
    EXPECT_EQ(2u, MarkupSelector::parse("[aria-label]").selectAll(doc.root()).size());

    const MarkupSelector::Node* beta = MarkupSelector::parse("[data-index=\"1\"]").selectFirst(doc.root());
    ASSERT_NE(nullptr, beta);
    EXPECT_EQ("view standings for beta", MarkupSelector::attributeOf(beta, "aria-label").value());
    EXPECT_FALSE(MarkupSelector::attributeOf(beta, "title").has_value());
}

TEST(MarkupSelectorTest, DescendantChainIsScopedToTheRow)
{
    Document doc(kMarkup);
    std::vector<const MarkupSelector::Node*> rows = MarkupSelector::parse(".row").selectAll(doc.root());
    ASSERT_EQ(2u, rows.size());

    MarkupSelector cellSpan = MarkupSelector::parse(".points [role=\"cell\"] span");
    EXPECT_NE(nullptr, cellSpan.selectFirst(rows[0]));
    EXPECT_EQ(nullptr, cellSpan.selectFirst(rows[1]));

    // The chain may not borrow ancestors from outside the scope
    MarkupSelector outer = MarkupSelector::parse(".table .name");
    EXPECT_EQ(nullptr, outer.selectFirst(rows[0]));
    EXPECT_NE(nullptr, outer.selectFirst(doc.root()));
}

TEST(MarkupSelectorTest, TextConcatenatesTrimmedPieces)
{
    Document doc(kMarkup);
    const MarkupSelector::Node* points = MarkupSelector::parse(".points").selectFirst(doc.root());
    ASSERT_NE(nullptr, points);
    EXPECT_EQ("1,204.5FPTS", MarkupSelector::textOf(points));
    EXPECT_EQ("", MarkupSelector::textOf(nullptr));
}
