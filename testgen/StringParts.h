#ifndef STRING_PARTS_H
#define STRING_PARTS_H
#include <string_view>
using tgstr = const char*;
using tgsv = std::string_view;

tgstr banner =
"// Generated by mdstyler_testgen from the HTML case file. Edit the JSON, not this file.\n";

tgstr includes =
"#include \"md_styler/MDStyler.h\"\n#include <gtest/gtest.h>\n\n";

tgstr anonNamespaceBegin = "namespace {\n";
tgstr anonNamespaceEnd = "}\n";

tgsv testSuiteName = "MDSHtmlCases";

#endif
