/* File: table.hpp
 *
 * Helpers for scraping the tables a switch renders as text: a header, a
 * line of dashes, data rows, and sometimes a "Total: N entries" summary.
 */
#ifndef DNOSTOOL_TABLE_HPP_INC
#define DNOSTOOL_TABLE_HPP_INC

#include <string>
#include <vector>


namespace dnostool {

std::vector< std::string > SplitLines(const std::string& text);

/* Rows between the first dash delimiter line and the next delimiter or
 * summary line, with blank lines dropped. Rows are returned untrimmed so
 * fixed-column slicing still lines up. No delimiter at all is a
 * ParseException naming `what`.
 */
std::vector< std::string > TableRows(const std::string& text,
const std::string& what);

std::vector< std::string > SplitFields(const std::string& line);

/* Characters [begin, end) of a fixed-column row, trimmed. Short rows give
 * an empty string.
 */
std::string Column(const std::string& line, size_t begin,
size_t end = std::string::npos);

/* Blank-line separated paragraphs, each as its lines joined with '\n'. */
std::vector< std::string > SplitBlocks(const std::string& text);

/* Finds "Label: value" or "Label....... value" at the start of a line and
 * returns the trimmed value. Returns false when the label is absent.
 */
bool FieldValue(const std::string& text, const std::string& label,
std::string* value);

} // namespace dnostool

#endif // DNOSTOOL_TABLE_HPP_INC
