#include <sortedschema.hpp>
#include <iostream>

int main()
{
    using namespace sortedschema;

    TypeAdapter leaderboard(types::model(
        "Leaderboard", {{"scores", types::sorted_dict(types::string(), types::integer())},
                        {"levels", types::sorted_set(types::integer())},
                        {"times", types::sorted_list(types::number())}}));

    auto board = leaderboard.validate_json(R"({
        "scores": {"zoe": 12, "adam": 40},
        "levels": [3, 1, 2],
        "times": [9.5, 7.25, 8.0]
    })");
    std::cout << leaderboard.dump_json(board).dump(2) << std::endl;

    try
    {
        leaderboard.validate_json(R"({"scores": {}, "levels": [1, 1], "times": ["fast"]})");
    }
    catch (const ValidationError& e)
    {
        std::cerr << e.what() << std::endl;
    }
    return 0;
}
