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


#ifndef MDS_JSON_H
#define MDS_JSON_H
#include <nlohmann/json.hpp>
#include "MDStyler.h"
#include "StyleConfig.h"

namespace md_styler {
	MDSTYLER_EXPORT void to_json(nlohmann::json& jc, const MDSNode& node);
	MDSTYLER_EXPORT void to_json(nlohmann::json& jc, const FontSpec& font);
	// Throws nlohmann::json::type_error for mistyped keys and std::invalid_argument for a non-numeric size.
	MDSTYLER_EXPORT void from_json(const nlohmann::json& jc, FontSpec& font);
	MDSTYLER_EXPORT void to_json(nlohmann::json& jc, const StyleConfig& config);

	MDSTYLER_EXPORT auto toJson(const Document& doc) -> nlohmann::json;
}

#endif
