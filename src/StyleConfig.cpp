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


#include <istream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "md_styler/StyleConfig.h"
#include "md_styler/Json.h"
#include "Log.h"

namespace md = md_styler;

md::StyleConfig md::StyleConfig::defaults() {
	StyleConfig config{};
	config.body = { "System", 13.0f, false };
	config.headings = { {
		{ "System", 28.0f, true },
		{ "System", 22.0f, true },
		{ "System", 18.0f, true },
		{ "System", 13.0f, true },
		{ "System", 13.0f, true },
		{ "System", 13.0f, true }
	} };
	config.code = { "Menlo", 13.0f, false };
	config.subscriptScale = 10.0f / 13.0f;
	config.subscriptBaselineOffset = -4.0f;
	config.bulletMarker = "\xE2\x80\xA2";
	return config;
}

namespace {
	md::TextStyle fromFont(const md::FontSpec& font, md::TextStyle::role_e role) {
		md::TextStyle style{};
		style.role = role;
		style.family = font.family;
		style.pointSize = font.size;
		style.bold = font.bold;
		return style;
	}
}

md::TextStyle md::StyleConfig::bodyStyle() const {
	return fromFont(body, TextStyle::role_e::Body);
}

md::TextStyle md::StyleConfig::headingStyle(UTinyInt level) const {
	// out-of-range levels clamp to the nearest heading font
	const size_t idx = level < 1 ? 0 : (level > headings.size() ? headings.size() - 1 : level - 1u);
	TextStyle style = fromFont(headings[idx], TextStyle::role_e::Heading);
	style.headingLevel = static_cast<UTinyInt>(idx + 1);
	return style;
}

md::TextStyle md::StyleConfig::markerStyle() const {
	return fromFont(body, TextStyle::role_e::ListMarker);
}

md::TextStyle md::StyleConfig::codeStyle() const {
	TextStyle style = fromFont(code, TextStyle::role_e::Code);
	style.monospace = true;
	return style;
}

md::TextStyle md::StyleConfig::mathStyle() const {
	return fromFont(body, TextStyle::role_e::Math);
}

md::TextStyle md::StyleConfig::subscriptStyle() const {
	TextStyle style = fromFont(body, TextStyle::role_e::Subscript);
	style.pointSize = body.size * subscriptScale;
	style.baselineOffset = subscriptBaselineOffset;
	return style;
}

auto md::loadStyleConfig(std::istream& in) -> std::optional<StyleConfig> {
	const nlohmann::json jc = nlohmann::json::parse(in, nullptr, false);
	if (jc.is_discarded() or !jc.is_object()) {
		mdsm_impl::log()->debug("style configuration is not a JSON object");
		return std::nullopt;
	}

	auto numberAt = [&jc](const char* key) -> float {
		const auto& value = jc.at(key);
		if (!value.is_number()) {
			throw std::invalid_argument{ std::string{ key } + " must be a number, not " + value.type_name() };
		}
		return value.get<float>();
	};

	StyleConfig config = StyleConfig::defaults();
	try {
		if (auto it = jc.find("body"); it != jc.end()) {
			it->get_to(config.body);
		}
		if (auto it = jc.find("headings"); it != jc.end()) {
			if (!it->is_array() or it->size() > config.headings.size()) {
				mdsm_impl::log()->debug("style configuration: \"headings\" must be an array of at most {} fonts", config.headings.size());
				return std::nullopt;
			}
			for (size_t i = 0; i < it->size(); ++i) {
				(*it)[i].get_to(config.headings[i]);
			}
		}
		if (auto it = jc.find("code"); it != jc.end()) {
			it->get_to(config.code);
		}
		if (jc.contains("subscriptScale")) {
			config.subscriptScale = numberAt("subscriptScale");
		}
		if (jc.contains("subscriptBaselineOffset")) {
			config.subscriptBaselineOffset = numberAt("subscriptBaselineOffset");
		}
		if (auto it = jc.find("bulletMarker"); it != jc.end()) {
			config.bulletMarker = it->get<std::string>();
		}
	}
	catch (const nlohmann::json::exception& e) {
		mdsm_impl::log()->debug("style configuration rejected: {}", e.what());
		return std::nullopt;
	}
	catch (const std::invalid_argument& e) {
		mdsm_impl::log()->debug("style configuration rejected: {}", e.what());
		return std::nullopt;
	}
	return config;
}
