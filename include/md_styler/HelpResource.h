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


#ifndef MDS_HELP_RESOURCE_H
#define MDS_HELP_RESOURCE_H
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "mdstyler_export.h"

namespace md_styler {
	/**
	Looks for name directly under bundleRoot, then under docs/, Doc/, Documentation/ and
	Resources/. The first readable file wins.
	*/
	MDSTYLER_EXPORT auto loadHelpMarkdown(const std::filesystem::path& bundleRoot, std::string_view name = "HELP.md") -> std::optional<std::string>;

	MDSTYLER_EXPORT auto helpMarkdownOrPlaceholder(const std::filesystem::path& bundleRoot, std::string_view title) -> std::string;
}

#endif
