/* File: proptree.cpp
 *
 * JSON in and out of PropTree, on top of yajl's callback parser and
 * generator.
 */


#include "proptree.hpp"

#include <cerrno>
#include <cstdlib>
#include <stack>

#include "common.hpp"
extern "C" {
#include <yajl/yajl_gen.h>
#include <yajl/yajl_parse.h>
}


namespace dnostool {

PropTree const& PropTree::at(std::string const& key) const {
	PropTreeChildrenMap::const_iterator fd = m_children_map.find(key);
	if (fd == m_children_map.end()) {
		static const PropTree empty;
		return empty;
	}
	return m_children_array[fd->second].second;
}

PropTree& PropTree::at(std::string const& key) {
	PropTreeChildrenMap::iterator fd = m_children_map.find(key);
	if (fd != m_children_map.end())
		return m_children_array[fd->second].second;
	m_children_map.insert(std::make_pair(key, m_children_array.size()));
	m_children_array.push_back(std::make_pair(key, PropTree()));
	return m_children_array.back().second;
}

PropTree& PropTree::ArrayPushBack(PropTree const& proptree) {
	m_children_array.push_back(std::make_pair(std::string(), proptree));
	return m_children_array.back().second;
}

std::string PropTree::GetString(std::string const& key,
std::string const& def) const {
	if (!ChildExists(key))
		return def;
	return at(key).GetData();
}

int PropTree::GetInt(std::string const& key, int def) const {
	std::string val = GetString(key);
	if (val.empty())
		return def;
	char* end = 0;
	errno = 0;
	long l = strtol(val.c_str(), &end, 10);
	if (errno != 0 || *end != '\0')
		throw DriverError(fmt("Option '%s' is not an integer: '%s'",
		key.c_str(), val.c_str()));
	return static_cast< int >(l);
}

double PropTree::GetDouble(std::string const& key, double def) const {
	std::string val = GetString(key);
	if (val.empty())
		return def;
	char* end = 0;
	errno = 0;
	double d = strtod(val.c_str(), &end);
	if (errno != 0 || *end != '\0')
		throw DriverError(fmt("Option '%s' is not a number: '%s'",
		key.c_str(), val.c_str()));
	return d;
}

bool PropTree::GetBool(std::string const& key, bool def) const {
	std::string val = GetString(key);
	if (val.empty())
		return def;
	if (val == "1" || val == "true" || val == "yes")
		return true;
	if (val == "0" || val == "false" || val == "no")
		return false;
	throw DriverError(fmt("Option '%s' is not a boolean: '%s'",
	key.c_str(), val.c_str()));
}


/* Scalars land in whatever slot is open: the pending map key, a new array
 * element, or the root itself.
 */
struct JsonPropTreeParser {
	struct Frame {
		PropTree* node;
		bool is_array;
		Frame(PropTree* n, bool a) : node(n), is_array(a) {}
	};

	std::stack< Frame > where;
	PropTree* root;
	PropTree* pending;

	JsonPropTreeParser(PropTree& populate)
	 : root(&populate),
	 pending(0) {
	}

	PropTree* Slot() {
		if (where.empty())
			return root;
		if (where.top().is_array)
			return &(where.top().node->ArrayPushBack(PropTree()));
		return pending;
	}

	static int OnNull(void* vme) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->Slot()->SetNull();
		return 1;
	}
	static int OnBool(void* vme, int val) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->Slot()->SetData(val ? "1" : "0");
		return 1;
	}
	static int OnNumber(void* vme, const char* val_start, size_t val_len) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->Slot()->SetData(std::string(val_start, val_len));
		return 1;
	}
	static int OnString(void* vme, const unsigned char* val_start,
	size_t val_len) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->Slot()->SetData(
			std::string(reinterpret_cast< const char* >(val_start), val_len)
		);
		return 1;
	}
	static int OnMapStart(void* vme) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		PropTree* node = me->Slot();
		node->SetObject();
		me->where.push(Frame(node, false));
		return 1;
	}
	static int OnMapKey(void* vme, const unsigned char* key_start,
	size_t key_len) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->pending = &((*(me->where.top().node))[
			std::string(reinterpret_cast< const char* >(key_start), key_len)
		]);
		return 1;
	}
	static int OnArrayStart(void* vme) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		PropTree* node = me->Slot();
		node->SetArray();
		me->where.push(Frame(node, true));
		return 1;
	}
	static int OnContainerEnd(void* vme) {
		JsonPropTreeParser* me = static_cast< JsonPropTreeParser* >(vme);
		me->where.pop();
		me->pending = 0;
		return 1;
	}
};

PropTree PropTree::FromJson(std::string const& json_string) {
	yajl_callbacks ycb = {
		JsonPropTreeParser::OnNull,
		JsonPropTreeParser::OnBool,
		0,
		0,
		JsonPropTreeParser::OnNumber,
		JsonPropTreeParser::OnString,
		JsonPropTreeParser::OnMapStart,
		JsonPropTreeParser::OnMapKey,
		JsonPropTreeParser::OnContainerEnd,
		JsonPropTreeParser::OnArrayStart,
		JsonPropTreeParser::OnContainerEnd
	};
	PropTree ret;
	JsonPropTreeParser jp(ret);
	yajl_handle yh = yajl_alloc(&ycb, 0, &jp);
	if (yajl_parse(
		yh,
		reinterpret_cast< const unsigned char* >(json_string.c_str()),
		json_string.length()
	) != yajl_status_ok
	|| yajl_complete_parse(yh) != yajl_status_ok) {
		unsigned char* err = yajl_get_error(
			yh,
			1,
			reinterpret_cast< const unsigned char* >(json_string.c_str()),
			json_string.length()
		);
		std::string msg = fmt("Unable to parse input as JSON:\n%s",
		reinterpret_cast< char* >(err));
		yajl_free_error(yh, err);
		yajl_free(yh);
		throw DriverError(msg);
	}
	yajl_free(yh);
	return ret;
}

static void GenString(yajl_gen g, std::string const& s) {
	yajl_gen_string(
		g,
		reinterpret_cast< const unsigned char* >(s.c_str()),
		s.length()
	);
}

static void GenRecursive(yajl_gen g, PropTree const& proptree) {
	if (!proptree.HasChildren()) {
		switch (proptree.GetKind()) {
			case PropTree::KIND_NULL:
				yajl_gen_null(g);
				break;
			case PropTree::KIND_OBJECT:
				yajl_gen_map_open(g);
				yajl_gen_map_close(g);
				break;
			case PropTree::KIND_ARRAY:
				yajl_gen_array_open(g);
				yajl_gen_array_close(g);
				break;
			default:
				GenString(g, proptree.GetData());
				break;
		}
	} else if (proptree.IsArray()) {
		yajl_gen_array_open(g);
		for (PropTree::const_iterator it = proptree.Begin();
		it != proptree.End();
		++it)
			GenRecursive(g, it->second);
		yajl_gen_array_close(g);
	} else {
		yajl_gen_map_open(g);
		for (PropTree::const_iterator it = proptree.Begin();
		it != proptree.End();
		++it) {
			if (it->first.empty())
				continue;
			GenString(g, it->first);
			GenRecursive(g, it->second);
		}
		yajl_gen_map_close(g);
	}
}

std::string PropTree::ToJson(bool beautify) const {
	yajl_gen g = yajl_gen_alloc(0);
	if (beautify)
		yajl_gen_config(g, yajl_gen_beautify, 1);
	GenRecursive(g, *this);
	const unsigned char* buf;
	size_t len;
	yajl_gen_get_buf(g, &buf, &len);
	std::string ret(reinterpret_cast< const char* >(buf), len);
	yajl_gen_free(g);
	return ret;
}

} // namespace dnostool
