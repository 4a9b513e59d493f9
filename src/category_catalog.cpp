#include "core/category_catalog.hpp"
#include <cctype>

namespace
{
    CategoryDefinition makeCategory(const std::string &id, const std::string &description,
                                    std::vector<std::string> prompts)
    {
        return CategoryDefinition{id, CategoryCatalog::displayName(id), description, std::move(prompts)};
    }
}

const std::vector<CategoryDefinition> &CategoryCatalog::all()
{
    static const std::vector<CategoryDefinition> catalog = {
        makeCategory("action", "Fast movement, fights, chases and sports",
                     {"an action scene with fast movement",
                      "people fighting or running in a chase",
                      "an intense sports moment"}),
        makeCategory("dialogue", "People talking to each other or to the camera",
                     {"two people having a conversation",
                      "a person talking to the camera",
                      "a close-up of someone speaking"}),
        makeCategory("landscape", "Scenery, nature and wide outdoor shots",
                     {"a beautiful landscape",
                      "a wide shot of nature and scenery",
                      "mountains, sea or sky at sunset"}),
        makeCategory("people", "Shots where people are the main subject",
                     {"a photo of people",
                      "a group of people together",
                      "a portrait of a person"}),
        makeCategory("text", "Titles, slides, signs and other on-screen text",
                     {"a slide with text",
                      "a title card with words on screen",
                      "a sign with written text"}),
        makeCategory("key_moments", "Visually striking or important moments",
                     {"an important dramatic moment",
                      "a memorable highlight of the video",
                      "a visually striking scene"}),
    };
    return catalog;
}

const CategoryDefinition *CategoryCatalog::find(const std::string &id)
{
    for (const auto &category : all())
    {
        if (category.id == id)
            return &category;
    }
    return nullptr;
}

std::string CategoryCatalog::displayName(const std::string &id)
{
    std::string name;
    bool start_of_word = true;
    for (char c : id)
    {
        if (c == '_')
        {
            name += ' ';
            start_of_word = true;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        name += static_cast<char>(start_of_word ? std::toupper(uc) : std::tolower(uc));
        start_of_word = false;
    }
    return name;
}

std::string CategoryCatalog::idList()
{
    std::string ids;
    for (const auto &category : all())
    {
        if (!ids.empty())
            ids += ", ";
        ids += category.id;
    }
    return ids;
}
