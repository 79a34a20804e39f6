#include <sstream>

#include <pcrecpp.h>

#include "table.hpp"
#include "canonical.hpp"
#include "common.hpp"


namespace dnostool {

std::vector< std::string > SplitLines(const std::string& text) {
	std::vector< std::string > lines;
	std::string::size_type start = 0;
	while (start <= text.length()) {
		std::string::size_type nl = text.find('\n', start);
		if (nl == std::string::npos)
			nl = text.length();
		std::string line = text.substr(start, nl - start);
		if (!line.empty() && line[line.length() - 1] == '\r')
			line.erase(line.length() - 1);
		lines.push_back(line);
		start = nl + 1;
	}
	return lines;
}

std::vector< std::string > TableRows(const std::string& text,
const std::string& what) {
	static const pcrecpp::RE delim1("----.*");
	static const pcrecpp::RE summary1("\\s*Total\\b.*");
	std::vector< std::string > lines = SplitLines(text);
	std::vector< std::string > rows;
	size_t i = 0;
	while (i < lines.size() && !delim1.FullMatch(lines[i]))
		++i;
	if (i == lines.size())
		throw ParseException(fmt("No table delimiter found in %s output",
		what.c_str()));
	for (++i; i < lines.size(); ++i) {
		if (delim1.FullMatch(lines[i]) || summary1.FullMatch(lines[i]))
			break;
		if (Trim(lines[i]).empty())
			continue;
		rows.push_back(lines[i]);
	}
	return rows;
}

std::vector< std::string > SplitFields(const std::string& line) {
	std::vector< std::string > fields;
	std::istringstream in(line);
	std::string f;
	while (in >> f)
		fields.push_back(f);
	return fields;
}

std::string Column(const std::string& line, size_t begin, size_t end) {
	if (begin >= line.length())
		return std::string();
	if (end == std::string::npos || end > line.length())
		end = line.length();
	return Trim(line.substr(begin, end - begin));
}

std::vector< std::string > SplitBlocks(const std::string& text) {
	std::vector< std::string > blocks;
	std::vector< std::string > lines = SplitLines(text);
	std::string cur;
	for (size_t i = 0; i < lines.size(); ++i) {
		if (Trim(lines[i]).empty()) {
			if (!cur.empty())
				blocks.push_back(cur);
			cur.clear();
			continue;
		}
		if (!cur.empty())
			cur += '\n';
		cur += lines[i];
	}
	if (!cur.empty())
		blocks.push_back(cur);
	return blocks;
}

bool FieldValue(const std::string& text, const std::string& label,
std::string* value) {
	pcrecpp::RE field1(
		"^[ \\t]*" + pcrecpp::RE::QuoteMeta(label)
		+ "[ \\t]*(?:\\.+|:)[ \\t.:]*(.*?)[ \\t\\r]*$",
		pcrecpp::RE_Options().set_multiline(true)
	);
	std::string v;
	if (!field1.PartialMatch(text, &v))
		return false;
	if (value)
		*value = v;
	return true;
}

} // namespace dnostool
