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


#include "md_styler/Rendering.h"
#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace md = md_styler;
using role_e = md::TextStyle::role_e;

namespace {
	TEST(MDSNativeRenderer, HeadingAndParagraph) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("# Hello\n\nSome text", std::nullopt);
		EXPECT_TRUE(styled.contains("Hello"));
		EXPECT_TRUE(styled.contains("Some text"));
		EXPECT_EQ(styled.plainText(), "Hello\n\nSome text\n");

		const md::StyleRun* heading = styled.runAt(0);
		ASSERT_NE(heading, nullptr);
		EXPECT_EQ(heading->style.role, role_e::Heading);
		EXPECT_EQ(heading->style.headingLevel, 1);
		EXPECT_FLOAT_EQ(heading->style.pointSize, 28.0f);
		EXPECT_TRUE(heading->style.bold);
		EXPECT_EQ(styled.textOf(*heading), "Hello");

		const md::StyleRun* body = styled.runAt(7);
		ASSERT_NE(body, nullptr);
		EXPECT_EQ(body->style.role, role_e::Body);
		EXPECT_EQ(styled.textOf(*body), "Some text");
	}

	TEST(MDSNativeRenderer, UnorderedListUsesBullet) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("- A\n- B", std::nullopt);
		EXPECT_EQ(styled.plainText(), "\xE2\x80\xA2 A\n\xE2\x80\xA2 B\n");
		const md::StyleRun* marker = styled.runAt(0);
		ASSERT_NE(marker, nullptr);
		EXPECT_EQ(marker->style.role, role_e::ListMarker);
	}

	TEST(MDSNativeRenderer, OrderedListNumbersByPosition) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("7. x\n9. y", std::nullopt);
		EXPECT_EQ(styled.plainText(), "1. x\n2. y\n");
	}

	TEST(MDSNativeRenderer, CodeBlockIsMonospaced) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("```swift\nlet x = 1\n```", std::nullopt);
		EXPECT_EQ(styled.plainText(), "let x = 1\n");
		const md::StyleRun* code = styled.runAt(0);
		ASSERT_NE(code, nullptr);
		EXPECT_EQ(code->style.role, role_e::Code);
		EXPECT_TRUE(code->style.monospace);
		EXPECT_EQ(code->style.family, "Menlo");
		EXPECT_EQ(styled.textOf(*code), "let x = 1");
	}

	TEST(MDSNativeRenderer, BlocksSeparatedByBlankLine) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("# T\npara\n- a\n1. b", std::nullopt);
		EXPECT_EQ(styled.plainText(), "T\n\npara\n\n\xE2\x80\xA2 a\n\n1. b\n");
	}

	TEST(MDSNativeRenderer, EmptyInput) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("", std::nullopt);
		EXPECT_TRUE(styled.empty());
		EXPECT_EQ(styled.length(), 0u);
	}

	TEST(MDSNativeRenderer, NulBytesFallBack) {
		const md::NativeRenderer renderer{};
		const std::string input(4, '\0');
		const auto styled = renderer.render(input, std::nullopt);
		EXPECT_EQ(styled.length(), 4u);
		EXPECT_EQ(styled.plainText(), input);
		EXPECT_FALSE(styled.isStyled());
	}

	TEST(MDSNativeRenderer, InvalidUtf8FallsBack) {
		const md::NativeRenderer renderer{};
		const std::string input = "# Title\n\xFF\xFE broken";
		const auto styled = renderer.render(input, md::BaseContext{ "https://example.com/" });
		EXPECT_EQ(styled.length(), input.size());
		EXPECT_EQ(styled.plainText(), input);
		EXPECT_FALSE(styled.isStyled());
	}

	TEST(MDSNativeRenderer, DeleteCharFallsBack) {
		const md::NativeRenderer renderer{};
		const std::string input = "text\x7F";
		const auto styled = renderer.render(input, std::nullopt);
		EXPECT_EQ(styled.plainText(), input);
		EXPECT_FALSE(styled.isStyled());
	}

	TEST(MDSNativeRenderer, RejectedInputKeepsLength) {
		const md::NativeRenderer renderer{};
		auto expectFallback = [&renderer](const std::string& input) {
			const auto styled = renderer.render(input, md::BaseContext{ "https://example.com/docs/" });
			EXPECT_EQ(styled.length(), input.size());
			EXPECT_EQ(styled.plainText(), input);
			EXPECT_FALSE(styled.isStyled());
		};

		std::vector<unsigned char> rejected{};
		for (unsigned c = 0x00; c <= 0xFF; ++c) {
			const bool allowed = c == '\t' or c == '\n' or c == '\r' or (c >= 0x20 and c <= 0x7E);
			if (!allowed) {
				rejected.push_back(static_cast<unsigned char>(c));
			}
		}
		for (const unsigned char c : rejected) {
			SCOPED_TRACE(static_cast<unsigned>(c));
			expectFallback(std::string(1, static_cast<char>(c)));
			expectFallback("# Title\n" + std::string(1, static_cast<char>(c)) + " [a](b)");
		}

		// C1 controls encoded as two-byte UTF-8
		for (unsigned c = 0x80; c <= 0x9F; ++c) {
			SCOPED_TRACE(c);
			expectFallback(std::string{ "\xC2" } + static_cast<char>(c));
			expectFallback("- item " + std::string{ "\xC2" } + static_cast<char>(c) + "\n");
		}

		// Bytes that can never be part of accepted text, whatever surrounds them
		std::vector<unsigned char> neverValid{};
		for (const unsigned char c : rejected) {
			if (c < 0x80 or c == 0xC0 or c == 0xC1 or c >= 0xF5) {
				neverValid.push_back(c);
			}
		}
		std::mt19937 rng{ 20240611u };
		std::uniform_int_distribution<int> lengthDist{ 0, 32 };
		std::uniform_int_distribution<int> byteDist{ 0, 255 };
		std::uniform_int_distribution<size_t> pickDist{ 0, neverValid.size() - 1 };
		for (int round = 0; round < 500; ++round) {
			std::string input{};
			const int len = lengthDist(rng);
			for (int i = 0; i < len; ++i) {
				input.push_back(static_cast<char>(byteDist(rng)));
			}
			std::uniform_int_distribution<size_t> posDist{ 0, input.size() };
			input.insert(input.begin() + static_cast<std::ptrdiff_t>(posDist(rng)), static_cast<char>(neverValid[pickDist(rng)]));
			SCOPED_TRACE(round);
			expectFallback(input);
		}
	}

	TEST(MDSNativeRenderer, TabsAndUnicodeAccepted) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("caf\xC3\xA9\tna\xC3\xAFve", std::nullopt);
		EXPECT_TRUE(styled.isStyled());
		EXPECT_EQ(styled.plainText(), "caf\xC3\xA9\tna\xC3\xAFve\n");
	}

	TEST(MDSNativeRenderer, LinkResolvedAgainstBase) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("See [docs](guide.md) now", md::BaseContext{ "https://example.com/a/index.md" });
		EXPECT_EQ(styled.plainText(), "See docs now\n");
		const md::StyleRun* link = styled.runAt(4);
		ASSERT_NE(link, nullptr);
		EXPECT_EQ(link->style.role, role_e::Link);
		EXPECT_EQ(link->style.target, "https://example.com/a/guide.md");
		EXPECT_EQ(styled.textOf(*link), "docs");
	}

	TEST(MDSNativeRenderer, LinkInHeadingResolved) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("# See [guide](guide.md)", md::BaseContext{ "https://x/a/" });
		EXPECT_EQ(styled.plainText(), "See guide\n");

		const md::StyleRun* lead = styled.runAt(0);
		ASSERT_NE(lead, nullptr);
		EXPECT_EQ(lead->style.role, role_e::Heading);
		EXPECT_EQ(styled.textOf(*lead), "See ");

		const md::StyleRun* link = styled.runAt(4);
		ASSERT_NE(link, nullptr);
		EXPECT_EQ(link->style.role, role_e::Link);
		EXPECT_EQ(link->style.target, "https://x/a/guide.md");
		EXPECT_EQ(link->style.headingLevel, 1);
		EXPECT_FLOAT_EQ(link->style.pointSize, 28.0f);
		EXPECT_TRUE(link->style.bold);
		EXPECT_EQ(styled.textOf(*link), "guide");
	}

	TEST(MDSNativeRenderer, LinkWithoutBaseKeepsReference) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("- [docs](guide.md)", std::nullopt);
		const md::StyleRun* link = styled.runAt(styled.plainText().find("docs"));
		ASSERT_NE(link, nullptr);
		EXPECT_EQ(link->style.role, role_e::Link);
		EXPECT_EQ(link->style.target, "guide.md");
	}

	TEST(MDSNativeRenderer, ImageShowsAltText) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("![logo](img/logo.png)", md::BaseContext{ "/usr/share/app/HELP.md" });
		EXPECT_EQ(styled.plainText(), "logo\n");
		const md::StyleRun* image = styled.runAt(0);
		ASSERT_NE(image, nullptr);
		EXPECT_EQ(image->style.role, role_e::Image);
		EXPECT_EQ(image->style.target, "/usr/share/app/img/logo.png");
	}

	TEST(MDSNativeRenderer, BaseDoesNotChangeStructure) {
		const md::NativeRenderer renderer{};
		const std::string input = "# T\n\nplain words\n- item";
		const auto without = renderer.render(input, std::nullopt);
		const auto with = renderer.render(input, md::BaseContext{ "https://example.com/" });
		EXPECT_EQ(without.plainText(), with.plainText());
		EXPECT_EQ(without.runs().size(), with.runs().size());
	}

	TEST(MDSNativeRenderer, MathSubscripts) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("Loss $\xCE\x94t$ and $x_i$", std::nullopt);
		EXPECT_EQ(styled.plainText(), "Loss \xCE\x94t and xi\n");

		const md::StyleRun* delta = styled.runAt(5);
		ASSERT_NE(delta, nullptr);
		EXPECT_EQ(delta->style.role, role_e::Math);
		EXPECT_EQ(styled.textOf(*delta), "\xCE\x94");

		const md::StyleRun* sub = styled.runAt(7);
		ASSERT_NE(sub, nullptr);
		EXPECT_EQ(sub->style.role, role_e::Subscript);
		EXPECT_FLOAT_EQ(sub->style.baselineOffset, -4.0f);
		EXPECT_FLOAT_EQ(sub->style.pointSize, 10.0f);
		EXPECT_EQ(styled.textOf(*sub), "t");

		const size_t iPos = styled.plainText().find("xi") + 1;
		const md::StyleRun* subI = styled.runAt(iPos);
		ASSERT_NE(subI, nullptr);
		EXPECT_EQ(subI->style.role, role_e::Subscript);
	}

	TEST(MDSNativeRenderer, ArgMaxSubscript) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("$arg max_x f$", std::nullopt);
		EXPECT_EQ(styled.plainText(), "arg maxx f\n");
		const md::StyleRun* op = styled.runAt(0);
		ASSERT_NE(op, nullptr);
		EXPECT_EQ(op->style.role, role_e::Math);
		EXPECT_EQ(styled.textOf(*op), "arg max");
		const md::StyleRun* sub = styled.runAt(7);
		ASSERT_NE(sub, nullptr);
		EXPECT_EQ(sub->style.role, role_e::Subscript);
	}

	TEST(MDSNativeRenderer, UnmatchedDollarIsLiteral) {
		const md::NativeRenderer renderer{};
		const auto styled = renderer.render("costs $5 total", std::nullopt);
		EXPECT_EQ(styled.plainText(), "costs $5 total\n");
		for (const auto& run : styled.runs()) {
			EXPECT_NE(run.style.role, role_e::Math);
		}
	}

	TEST(MDSNativeRenderer, CustomBulletMarker) {
		md::StyleConfig config = md::StyleConfig::defaults();
		config.bulletMarker = "*";
		const md::NativeRenderer renderer{ config };
		EXPECT_EQ(renderer.render("- A", std::nullopt).plainText(), "* A\n");
		EXPECT_EQ(renderer.config().bulletMarker, "*");
	}

	TEST(MDSNativeRenderer, Deterministic) {
		const md::NativeRenderer renderer{};
		const std::string input = "# T\n\n[a](b) $x_1$\n```\ncode\n```";
		const auto first = renderer.render(input, std::nullopt);
		const auto second = renderer.render(input, std::nullopt);
		EXPECT_EQ(first.plainText(), second.plainText());
		ASSERT_EQ(first.runs().size(), second.runs().size());
		for (size_t i = 0; i < first.runs().size(); ++i) {
			EXPECT_EQ(first.runs()[i].begin, second.runs()[i].begin);
			EXPECT_EQ(first.runs()[i].length, second.runs()[i].length);
			EXPECT_TRUE(first.runs()[i].style == second.runs()[i].style);
		}
	}

	TEST(MDSRecordingRenderer, ObservesInputUnmodified) {
		const md::RecordingRenderer recorder{};
		const std::string input{ "# Title\r\n\0raw $x_1$", 19 };
		const auto styled = recorder.render(input, std::nullopt);
		EXPECT_EQ(recorder.lastInput(), input);
		EXPECT_EQ(recorder.callCount(), 1u);
		EXPECT_FALSE(recorder.lastBase().has_value());
		EXPECT_EQ(styled.plainText(), "[MOCK]\n" + input);
		EXPECT_FALSE(styled.isStyled());
	}

	TEST(MDSRecordingRenderer, ThroughInterface) {
		const md::RecordingRenderer recorder{};
		const md::MarkdownRendering& rendering = recorder;
		rendering.render("first", std::nullopt);
		const auto styled = rendering.render("second", md::BaseContext{ "https://example.com/" });
		EXPECT_EQ(recorder.callCount(), 2u);
		EXPECT_EQ(recorder.lastInput(), "second");
		ASSERT_TRUE(recorder.lastBase().has_value());
		EXPECT_EQ(recorder.lastBase()->base, "https://example.com/");
		EXPECT_EQ(styled.plainText(), "[MOCK]\nsecond");
	}

	TEST(MDSRendering, ImplementationsAreInterchangeable) {
		std::vector<std::unique_ptr<md::MarkdownRendering>> renderers{};
		renderers.push_back(std::make_unique<md::NativeRenderer>());
		renderers.push_back(std::make_unique<md::RecordingRenderer>());
		for (const auto& renderer : renderers) {
			EXPECT_TRUE(renderer->render("hello", std::nullopt).contains("hello"));
		}
	}
}
