#include <gtest/gtest.h>
#include "../include/extractor.hpp"
#include "../include/text.hpp"
#include "test_support.hpp"

namespace {
const char* kPage = R"(<html>
<head>
  <title>  My   Page </title>
  <meta name="description" content="Everything about admissions and fees.">
  <style>.x { color: red; }</style>
</head>
<body>
  <header><p>Site header text that is long enough to count</p></header>
  <nav><a href="/nav-target">Navigation link with plenty of text</a></nav>
  <h1>Welcome Home</h1>
  <p>Our admissions office is open from Monday to Friday every week.</p>
  <img src="campus.png" alt="Campus library at dusk">
  <ul><li>Tuition is paid each semester in two parts.</li></ul>
  <script>var brochure = "/files/brochure.pdf";</script>
  <a href="/about">About us</a>
  <footer><p>Footer text that is also long enough to count</p></footer>
</body>
</html>)";
}

TEST(HtmlExtractor, KeepsContentBlocksInOrder) {
    HtmlExtractor ex;
    auto out = ex.extract(std::string(kPage));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->kind, SourceKind::Web);
    EXPECT_EQ(out->title, "My Page");

    const std::string& t = out->text;
    auto meta = t.find("META: Everything about admissions and fees.");
    auto heading = t.find("HEADING: Welcome Home");
    auto para = t.find("Our admissions office is open from Monday to Friday every week.");
    auto image = t.find("IMAGE: Campus library at dusk");
    auto item = t.find("Tuition is paid each semester in two parts.");
    ASSERT_NE(meta, std::string::npos);
    ASSERT_NE(heading, std::string::npos);
    ASSERT_NE(para, std::string::npos);
    ASSERT_NE(image, std::string::npos);
    ASSERT_NE(item, std::string::npos);
    EXPECT_LT(meta, heading);
    EXPECT_LT(heading, para);
    EXPECT_LT(para, image);
    EXPECT_LT(image, item);
}

TEST(HtmlExtractor, SkipsBoilerplate) {
    HtmlExtractor ex;
    auto out = ex.extract(std::string(kPage));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->text.find("Navigation link"), std::string::npos);
    EXPECT_EQ(out->text.find("Site header text"), std::string::npos);
    EXPECT_EQ(out->text.find("Footer text"), std::string::npos);
    EXPECT_EQ(out->text.find("brochure"), std::string::npos);
    EXPECT_EQ(out->text.find("color"), std::string::npos);
}

TEST(HtmlExtractor, ShortPagesAreRejected) {
    HtmlExtractor ex;
    EXPECT_FALSE(ex.extract(std::string("<html><body><p>Too short to be useful here.</p></body></html>")).has_value());
}

TEST(HtmlExtractor, MissingTitleUsesFallback) {
    HtmlExtractor ex;
    std::string body = "<html><body><p>" + std::string(40, 'x') + " " + std::string(40, 'y') + " " +
                       std::string(40, 'z') + "</p></body></html>";
    auto out = ex.extract(body);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->title, HtmlExtractor::kFallbackTitle);
}

TEST(HtmlDocument, LinksIncludeNavigationAndScripts) {
    HtmlDocument doc(kPage);
    auto links = doc.links();
    ASSERT_EQ(links.hrefs.size(), 2u);
    EXPECT_EQ(links.hrefs[0], "/nav-target");
    EXPECT_EQ(links.hrefs[1], "/about");
    ASSERT_EQ(links.scripts.size(), 1u);
    EXPECT_NE(links.scripts[0].find("/files/brochure.pdf"), std::string::npos);
}

TEST(PdfExtractor, ExtractsPagesInOrder) {
    std::string pdf = make_pdf({"Tuition fees are due in March each year.",
                                "Scholarships close on the first of May."});
    PdfExtractor ex;
    auto out = ex.extract(pdf);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->kind, SourceKind::Pdf);
    auto first = out->text.find("Tuition fees are due in March");
    auto second = out->text.find("Scholarships close on the first of May");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_EQ(normalize_text(out->text), out->text);
}

TEST(PdfExtractor, BlankDocumentHasNoText) {
    PdfExtractor ex;
    EXPECT_FALSE(ex.extract(make_pdf({""})).has_value());
}

TEST(PdfExtractor, GarbageInputThrows) {
    PdfExtractor ex;
    EXPECT_THROW(ex.extract(std::string("this is not a pdf at all")), std::runtime_error);
}

TEST(SourceKindNames, RoundTrip) {
    EXPECT_STREQ(source_kind_name(SourceKind::Pdf), "pdf");
    EXPECT_EQ(parse_source_kind("web").value(), SourceKind::Web);
    EXPECT_FALSE(parse_source_kind("ftp").has_value());
}
