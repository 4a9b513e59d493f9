#pragma once

#include <string>
#include <vector>

/**
 * @brief One fixed summarization category
 */
struct CategoryDefinition
{
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> prompts; // ensembled into one text embedding
};

/**
 * @brief Read-only catalog of the categories a request may name
 */
class CategoryCatalog
{
public:
    static const std::vector<CategoryDefinition> &all();

    /**
     * @brief Look up a category by id
     * @return The definition, or nullptr for an unknown id
     */
    static const CategoryDefinition *find(const std::string &id);

    static bool contains(const std::string &id) { return find(id) != nullptr; }

    /**
     * @brief Display name of an id: underscores become spaces, words are title-cased
     */
    static std::string displayName(const std::string &id);

    // Comma separated ids, for error messages
    static std::string idList();
};
