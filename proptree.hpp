/* File: proptree.hpp
 *
 * PropTree is a small JSON-like property tree: a key-value hierarchy where
 * keys are strings and values are either strings or child PropTrees. It is
 * the currency of the control channel: driver configuration arrives as a
 * PropTree parsed from JSON, and retrieved facts leave as a PropTree
 * serialized back to JSON.
 *
 * Children keep their insertion order. Keyed children are additionally
 * indexed in a map for O(log(n)) lookup; array children carry an empty key
 * and are not indexed.
 */
#ifndef DNOSTOOL_PROPTREE_HPP_INC
#define DNOSTOOL_PROPTREE_HPP_INC

#include <vector>
#include <map>
#include <string>


namespace dnostool {

class PropTree;

typedef std::vector<
	std::pair< std::string, PropTree >
> PropTreeChildrenArray;
typedef std::map< std::string, size_t > PropTreeChildrenMap;

class PropTree
{
public:
	typedef PropTreeChildrenArray::iterator iterator;
	typedef PropTreeChildrenArray::const_iterator const_iterator;

	/* What a childless node serializes as. Nodes with children are always
	 * an object or an array.
	 */
	enum Kind {
		KIND_STRING = 0,
		KIND_NULL,
		KIND_OBJECT,
		KIND_ARRAY
	};

	static PropTree FromJson(std::string const& json_string);

	PropTree() : m_kind(KIND_STRING) {}

	PropTree(std::string const& data)
	 : m_data(data),
	 m_kind(KIND_STRING)
	{}

	PropTree(const char* data)
	 : m_data(data),
	 m_kind(KIND_STRING)
	{}

	PropTree& operator = (std::string const& data) {
		m_data = data;
		m_kind = KIND_STRING;
		m_children_array.clear();
		m_children_map.clear();
		return *this;
	}

	PropTree& operator = (const char* data) {
		return *this = std::string(data);
	}

	PropTree& operator [] (std::string const& key) {
		return at(key);
	}
	PropTree const& operator [] (std::string const& key) const {
		return at(key);
	}

	operator std::string () const {
		return m_data;
	}

	friend bool operator == (const PropTree& x, const std::string& y) {
		return (x.m_data == y);
	}
	friend bool operator != (const PropTree& x, const std::string& y) {
		return (x.m_data != y);
	}

	bool HasChildren() const {
		return !m_children_array.empty();
	}

	/* A tree whose children were all added with ArrayPushBack. */
	bool IsArray() const {
		return HasChildren() && m_children_map.empty();
	}

	bool ChildExists(std::string const& child) const {
		return (m_children_map.find(child) != m_children_map.end());
	}

	size_t Size() const {
		return m_children_array.size();
	}

	PropTree const& at(size_t idx) const {
		return m_children_array[idx].second;
	}
	PropTree& at(size_t idx) {
		return m_children_array[idx].second;
	}
	PropTree const& at(std::string const& key) const;
	PropTree& at(std::string const& key);

	PropTree& ArrayPushBack(PropTree const& proptree);

	std::string GetData() const {
		return m_data;
	}
	void SetData(std::string const& data) {
		m_data = data;
	}

	Kind GetKind() const {
		return m_kind;
	}
	// An empty node becomes null, {} or [] instead of "".
	void SetNull() {
		*this = std::string();
		m_kind = KIND_NULL;
	}
	void SetObject() {
		m_kind = KIND_OBJECT;
	}
	void SetArray() {
		m_kind = KIND_ARRAY;
	}

	/* Typed reads of a child leaf. A missing child yields the default; a
	 * child that is present but does not convert is a DriverError.
	 */
	std::string GetString(std::string const& key,
	std::string const& def = std::string()) const;
	int GetInt(std::string const& key, int def) const;
	double GetDouble(std::string const& key, double def) const;
	bool GetBool(std::string const& key, bool def) const;

	std::string ToJson(bool beautify = false) const;

	iterator Begin() {
		return m_children_array.begin();
	}
	const_iterator Begin() const {
		return m_children_array.begin();
	}
	iterator End() {
		return m_children_array.end();
	}
	const_iterator End() const {
		return m_children_array.end();
	}

private:
	std::string m_data;
	Kind m_kind;
	PropTreeChildrenArray m_children_array;
	PropTreeChildrenMap m_children_map;
};

} // namespace dnostool

#endif // DNOSTOOL_PROPTREE_HPP_INC
