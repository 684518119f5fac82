#ifndef CJAIL_PROPERTIES_H
#define CJAIL_PROPERTIES_H

#include <string>
#include <map>
#include <vector>
#include <any>

namespace cjail {

/**
 * @brief Key-value property container
 *
 * Properties stores key-value pairs where keys are strings and values
 * can be of any type (using std::any). Provides typed getters with
 * default value support. String values are converted on read, so a
 * value captured from an environment variable ("yes", "a:b") can be read
 * as a bool or a string list.
 *
 * Not synchronized: a configuration is built once and then only read.
 */
class Properties {
public:
    /**
     * @brief Set a property value
     * @param key Property key
     * @param value Property value (any type)
     */
    void set(const std::string& key, const std::any& value);

    /**
     * @brief Get a string property
     * @return Property value as string, or defaultValue if not found or wrong type
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get a boolean property
     *
     * String values "true", "1", "yes" and "on" read as true, any other
     * string reads as false.
     *
     * @return Property value as bool, or defaultValue if not found or wrong type
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a string list property
     *
     * A std::vector<std::string> value is returned as is. A string value is
     * split on ':' with empty elements dropped.
     *
     * @return Property value as list, or an empty list if not found
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    /**
     * @brief Check if a property exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Get all property keys (sorted)
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Merge another Properties object into this one
     *
     * Existing keys are overwritten with values from other. Values are
     * replaced wholesale: two lists are never concatenated.
     *
     * @param other Properties to merge
     */
    void merge(const Properties& other);

private:
    std::map<std::string, std::any> properties_;
};

} // namespace cjail

#endif // CJAIL_PROPERTIES_H
