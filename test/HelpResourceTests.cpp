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


#include "md_styler/HelpResource.h"
#include <gtest/gtest.h>
#include <fstream>
#include <random>

namespace md = md_styler;
namespace fs = std::filesystem;

namespace {
	class MDSHelpResource : public ::testing::Test {
	protected:
		void SetUp() override {
			std::random_device rd{};
			root_ = fs::temp_directory_path() / ("mdstyler_help_" + std::to_string(rd()));
			fs::create_directories(root_);
		}
		void TearDown() override {
			std::error_code ec{};
			fs::remove_all(root_, ec);
		}
		void writeFile(const fs::path& rel, const std::string& text) {
			fs::create_directories((root_ / rel).parent_path());
			std::ofstream out{ root_ / rel, std::ios::binary };
			out << text;
		}

		fs::path root_;
	};

	TEST_F(MDSHelpResource, MissingGivesNullopt) {
		EXPECT_FALSE(md::loadHelpMarkdown(root_).has_value());
		EXPECT_FALSE(md::loadHelpMarkdown(root_ / "does-not-exist").has_value());
	}

	TEST_F(MDSHelpResource, Placeholder) {
		EXPECT_EQ(md::helpMarkdownOrPlaceholder(root_, "Sampler"), "# Sampler Help\n\nHELP.md not bundled.");
	}

	TEST_F(MDSHelpResource, FoundAtRoot) {
		writeFile("HELP.md", "# Root\n");
		writeFile("docs/HELP.md", "# Docs\n");
		EXPECT_EQ(md::loadHelpMarkdown(root_), "# Root\n");
	}

	TEST_F(MDSHelpResource, SubdirectoryOrder) {
		writeFile("Resources/HELP.md", "# Resources\n");
		writeFile("Documentation/HELP.md", "# Documentation\n");
		EXPECT_EQ(md::loadHelpMarkdown(root_), "# Documentation\n");
		writeFile("docs/HELP.md", "# Docs\n");
		EXPECT_EQ(md::loadHelpMarkdown(root_), "# Docs\n");
		EXPECT_EQ(md::helpMarkdownOrPlaceholder(root_, "App"), "# Docs\n");
	}

	TEST_F(MDSHelpResource, CustomName) {
		writeFile("Doc/GUIDE.md", "guide");
		EXPECT_FALSE(md::loadHelpMarkdown(root_).has_value());
		EXPECT_EQ(md::loadHelpMarkdown(root_, "GUIDE.md"), "guide");
	}

	TEST_F(MDSHelpResource, DirectoryNamedLikeFileIsSkipped) {
		fs::create_directories(root_ / "HELP.md");
		writeFile("Resources/HELP.md", "bundled");
		EXPECT_EQ(md::loadHelpMarkdown(root_), "bundled");
	}
}
