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


#ifndef MDS_RENDERING_H
#define MDS_RENDERING_H
#include <optional>
#include <string>
#include <string_view>
#include "StyleConfig.h"
#include "StyledText.h"
#include "mdstyler_export.h"

namespace md_styler {
	// Absolute location that relative link and image references resolve against.
	struct BaseContext {
		std::string base;
	};

	class MarkdownRendering {
	public:
		virtual ~MarkdownRendering() = default;

		/**
		Never fails. Content that cannot be styled comes back as unstyled plain text with the same
		length as markdown.
		*/
		virtual StyledText render(std::string_view markdown, const std::optional<BaseContext>& base) const = 0;
	};

	class MDSTYLER_EXPORT NativeRenderer final : public MarkdownRendering {
	public:
		NativeRenderer();
		explicit NativeRenderer(StyleConfig config);

		StyledText render(std::string_view markdown, const std::optional<BaseContext>& base) const override;

		const StyleConfig& config() const noexcept { return config_; }
	private:
		StyleConfig config_;
	};

	// Test double: keeps the last input verbatim and tags what it returns.
	class MDSTYLER_EXPORT RecordingRenderer final : public MarkdownRendering {
	public:
		static constexpr std::string_view TAG = "[MOCK]";

		StyledText render(std::string_view markdown, const std::optional<BaseContext>& base) const override;

		const std::string& lastInput() const noexcept { return lastInput_; }
		const std::optional<BaseContext>& lastBase() const noexcept { return lastBase_; }
		size_t callCount() const noexcept { return calls_; }
	private:
		mutable std::string                lastInput_;
		mutable std::optional<BaseContext>  lastBase_;
		mutable size_t                         calls_ = 0;
	};

	MDSTYLER_EXPORT auto resolveReference(std::string_view ref, const BaseContext& base) -> std::string;
}

#endif
