#pragma once
#include <map>
#include <string>

// Tunable mappings used to infer context features. Defaults reproduce the
// observed behaviour; deployments may override them from config.
struct FeatureHeuristics {
    // component type -> application archetype
    std::map<std::string, std::string> archetypes = {
        {"ProductCard", "e-commerce"}, {"ShoppingCart", "e-commerce"}, {"PriceTag", "e-commerce"},
        {"Chart", "dashboard"},        {"DataTable", "dashboard"},     {"Widget", "dashboard"},
        {"Article", "blog"},           {"BlogPost", "blog"},           {"Comment", "blog"},
        {"Post", "social"},            {"Profile", "social"},          {"Feed", "social"},
    };

    // share of records the most frequent component type needs before its
    // archetype is used; below it the set counts as mixed
    double dominanceThreshold = 0.5;

    // layout position -> device bucket (desktop | tablet | mobile | other)
    std::map<std::string, std::string> positions = {
        {"main", "desktop"}, {"sidebar", "tablet"}, {"header", "mobile"},
        {"footer", "other"}, {"modal", "other"},    {"other", "other"},
    };

    // archetype -> industry
    std::map<std::string, std::string> industries = {
        {"e-commerce", "retail"}, {"dashboard", "technology"},
        {"blog", "media"},        {"social", "social-media"},
    };

    // render time that still counts as fully performant (one 60fps frame)
    double renderBudgetMs = 16.0;
};
