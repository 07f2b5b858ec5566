/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/


#include "md_styler/StyleConfig.h"
#include "md_styler/Json.h"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace md = md_styler;

namespace {
	auto loadFrom(const std::string& text) -> std::optional<md::StyleConfig> {
		std::istringstream in{ text };
		return md::loadStyleConfig(in);
	}

	TEST(MDSStyleConfig, Defaults) {
		const auto config = md::StyleConfig::defaults();
		EXPECT_FLOAT_EQ(config.headings[0].size, 28.0f);
		EXPECT_FLOAT_EQ(config.headings[1].size, 22.0f);
		EXPECT_FLOAT_EQ(config.headings[2].size, 18.0f);
		EXPECT_TRUE(config.headings[5].bold);
		EXPECT_FLOAT_EQ(config.subscriptBaselineOffset, -4.0f);
		EXPECT_EQ(config.bulletMarker, "\xE2\x80\xA2");
		EXPECT_TRUE(config.codeStyle().monospace);
		EXPECT_EQ(config.headingStyle(9).headingLevel, 6);
		EXPECT_EQ(config.headingStyle(0).headingLevel, 1);
	}

	TEST(MDSStyleConfig, EmptyObjectKeepsDefaults) {
		const auto config = loadFrom("{}");
		ASSERT_TRUE(config.has_value());
		EXPECT_EQ(config->body.family, md::StyleConfig::defaults().body.family);
		EXPECT_EQ(config->bulletMarker, md::StyleConfig::defaults().bulletMarker);
	}

	TEST(MDSStyleConfig, Overrides) {
		const auto config = loadFrom(R"({
			"body": { "family": "Helvetica", "size": 15 },
			"headings": [ { "size": 40 }, { "family": "Georgia", "bold": false } ],
			"code": { "family": "Courier" },
			"subscriptScale": 0.5,
			"subscriptBaselineOffset": -2,
			"bulletMarker": "-"
		})");
		ASSERT_TRUE(config.has_value());
		EXPECT_EQ(config->body.family, "Helvetica");
		EXPECT_FLOAT_EQ(config->body.size, 15.0f);
		EXPECT_FLOAT_EQ(config->headings[0].size, 40.0f);
		EXPECT_TRUE(config->headings[0].bold);
		EXPECT_EQ(config->headings[1].family, "Georgia");
		EXPECT_FALSE(config->headings[1].bold);
		EXPECT_FLOAT_EQ(config->headings[2].size, 18.0f);
		EXPECT_EQ(config->code.family, "Courier");
		EXPECT_EQ(config->bulletMarker, "-");

		const auto sub = config->subscriptStyle();
		EXPECT_FLOAT_EQ(sub.pointSize, 7.5f);
		EXPECT_FLOAT_EQ(sub.baselineOffset, -2.0f);
	}

	TEST(MDSStyleConfig, MalformedJson) {
		EXPECT_FALSE(loadFrom("{ \"body\": ").has_value());
		EXPECT_FALSE(loadFrom("").has_value());
		EXPECT_FALSE(loadFrom("[1, 2]").has_value());
	}

	TEST(MDSStyleConfig, WrongTypes) {
		EXPECT_FALSE(loadFrom(R"({ "body": { "size": "big" } })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "body": "Helvetica" })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "bulletMarker": 3 })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "headings": {} })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "headings": [{},{},{},{},{},{},{}] })").has_value());
	}

	TEST(MDSStyleConfig, BooleansAreNotNumbers) {
		EXPECT_FALSE(loadFrom(R"({ "subscriptScale": true })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "subscriptBaselineOffset": false })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "body": { "size": false } })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "headings": [ { "size": true } ] })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "code": { "bold": 1 } })").has_value());
		EXPECT_FALSE(loadFrom(R"({ "subscriptScale": "0.5" })").has_value());

		md::FontSpec font = md::StyleConfig::defaults().body;
		EXPECT_THROW(nlohmann::json::parse(R"({ "size": true })").get_to(font), std::invalid_argument);
		EXPECT_FLOAT_EQ(font.size, 13.0f);
	}

	TEST(MDSStyleConfig, JsonRoundTrip) {
		const auto defaults = md::StyleConfig::defaults();
		const nlohmann::json jc = defaults;
		std::istringstream in{ jc.dump() };
		const auto reloaded = md::loadStyleConfig(in);
		ASSERT_TRUE(reloaded.has_value());
		EXPECT_EQ(reloaded->code.family, defaults.code.family);
		EXPECT_FLOAT_EQ(reloaded->headings[1].size, defaults.headings[1].size);
		EXPECT_EQ(reloaded->bulletMarker, defaults.bulletMarker);
	}

	TEST(MDSJsonExport, DocumentDump) {
		const auto jc = md::toJson(md::parse("# T\n- a\n- b\n```sh\nls\n```\ntext"));
		const auto expected = nlohmann::json::parse(R"([
			{ "type": "heading", "level": 1, "text": "T" },
			{ "type": "unordered_list", "items": ["a", "b"] },
			{ "type": "code_block", "language": "sh", "code": "ls" },
			{ "type": "paragraph", "text": "text" }
		])");
		EXPECT_EQ(jc, expected);
	}

	TEST(MDSJsonExport, EmptyDocumentIsEmptyArray) {
		const auto jc = md::toJson({});
		EXPECT_TRUE(jc.is_array());
		EXPECT_TRUE(jc.empty());
	}
}
