#include <iostream>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include "StringParts.h"

using CaseGroup = std::pair<std::string, std::vector<const nlohmann::json*>>;

std::string outResult(const nlohmann::json& jc, int indentLvl);
std::string func(const nlohmann::json& jc, int indentLvl);
std::string body_(const CaseGroup& group, int indentLvl);
std::vector<CaseGroup> organizeJson(const nlohmann::json& root);
bool validCase(const nlohmann::json& el);

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str);
void removeChar(std::string& str, char c);

int main(int argc, char** argv) {
	if (argc != 3) {
		std::cerr << "usage: mdstyler_testgen <cases.json> <output.cpp>\n";
		return 1;
	}
	std::fstream fileIo{ argv[1], std::fstream::in };
	if (!fileIo) {
		std::cerr << "File not found: " << argv[1] << "\n";
		return 1;
	}
	nlohmann::json jcee = nlohmann::json::parse(fileIo, nullptr, false);
	if (jcee.is_discarded() or !jcee.is_array()) {
		std::cerr << argv[1] << ": expected a JSON array of cases\n";
		return 1;
	}
	for (auto& el : jcee) {
		if (!validCase(el)) {
			std::cerr << argv[1] << ": malformed case " << el.dump() << "\n";
			return 1;
		}
		auto& arg = el["markdown"].get_ref<std::string&>();
		escapeBackslashString<'\\', '\\', true>(arg);
		escapeBackslashString<'\n', 'n', true>( arg );
		escapeBackslashString<'\r', 'r', true>(arg);
		escapeBackslashString<'\t', 't', true>(arg);
		escapeBackslashString<'"', '"', true>(arg);
		auto& arg2 = el["html"].get_ref<std::string&>();
		escapeBackslashString<'\\', '\\', true>(arg2);
		escapeBackslashString<'\n', 'n', true>( arg2 );
		escapeBackslashString<'\r', 'r', true>(arg2);
		escapeBackslashString<'\t', 't', true>(arg2);
		escapeBackslashString<'"', '"', true>(arg2);
	}

	fileIo.close();

	fileIo.open(argv[2], std::fstream::out | std::fstream::trunc);
	if (!fileIo) {
		std::cerr << "cannot write " << argv[2] << "\n";
		return 1;
	}
	fileIo << outResult(jcee, 0);
	return fileIo.fail() ? 1 : 0;
}

std::string outResult(const nlohmann::json& jc, int indentLvl) {
	return std::string{ banner } + includes + anonNamespaceBegin + func(jc, indentLvl+1) + anonNamespaceEnd;
}

std::string func(const nlohmann::json& jc, int indentLvl) {
	std::string res{};
	for (const auto& group : organizeJson(jc)) {
		std::string section = group.first;
		removeChar(section, ' ');
		res.append(fmt::format("{0: <{3}}TEST({1}, {2}) {{\n{4}{0: <{3}}}}\n", "", testSuiteName, section, indentLvl * 4, body_(group, indentLvl + 1)));
	}
	return res;
}

std::string body_(const CaseGroup& group, int indentLvl) {
	std::string res{};
	for (const nlohmann::json* el : group.second) {
		const auto& markdown = (*el)["markdown"].get_ref<const std::string&>();
		const auto& html = (*el)["html"].get_ref<const std::string&>();
		res.append(fmt::format("{0: <{4}}auto str{3:0>4d} = md_styler::mdToHtml(\"{1}\");\n"
			"{0: <{4}}EXPECT_STREQ(str{3:0>4d}.c_str(), \"{2}\");\n\n", "", markdown, html, (*el)["example"].get<unsigned int>(), indentLvl * 4));
	}
	return res;
}

// Sections keep the order of their first appearance; cases keep file order within a section.
std::vector<CaseGroup> organizeJson(const nlohmann::json& root) {
	std::vector<CaseGroup> res{};
	for (const auto& el : root) {
		const auto& section = el["section"].get_ref<const std::string&>();
		auto it = std::find_if(res.begin(), res.end(), [&section](const CaseGroup& g) { return g.first == section; });
		if (it == res.end()) {
			res.emplace_back(section, std::vector<const nlohmann::json*>{});
			it = std::prev(res.end());
		}
		it->second.push_back(&el);
	}
	return res;
}

bool validCase(const nlohmann::json& el) {
	return el.is_object() and
		el.contains("markdown") and el["markdown"].is_string() and
		el.contains("html") and el["html"].is_string() and
		el.contains("section") and el["section"].is_string() and
		el.contains("example") and el["example"].is_number_unsigned();
}

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(OldVal, i); i != std::string::npos) {
			str[i] = NewVal;
			if (NeedEscape) {
				str.insert(str.begin() + i, '\\');
			}
			++i;
		}
		else {
			break;
		}
	}
}
void removeChar(std::string& str, char c) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(c, i); i != std::string::npos) {
			str.erase(i, 1);
			--i;
		}
		else {
			break;
		}
	}
}
