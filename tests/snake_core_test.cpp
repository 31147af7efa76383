#include <gtest/gtest.h>

#include "snake_core.h"
#include "scripted_random.h"

#include <algorithm>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

CoreConfig makeConfig(int width, int height, int length = 3,
                      Direction direction = Direction::RIGHT, bool wrap = false) {
    CoreConfig config;
    config.width = width;
    config.height = height;
    config.initialLength = length;
    config.initialDirection = direction;
    config.wrapAround = wrap;
    return config;
}

// Food always lands on the first free cell, (0,0) on a fresh board
std::unique_ptr<SnakeCore> makeCore(const CoreConfig& config) {
    return std::make_unique<SnakeCore>(config, std::make_unique<ScriptedRandom>());
}

// First food at the given row-major index among the free cells
std::unique_ptr<SnakeCore> makeCoreWithFood(const CoreConfig& config, int firstPick) {
    return std::make_unique<SnakeCore>(
        config, std::make_unique<ScriptedRandom>(std::initializer_list<int>{firstPick}));
}

// On a fresh 10x10 board, the cell in front of the head
constexpr int AHEAD_WHEN_RIGHT = 53; // (6,5): 50 cells above, then x = 0, 1, 2, 6
constexpr int AHEAD_WHEN_LEFT = 54;  // (4,5): 50 cells above, then x = 0..4

// Returns an index one past the end of the range
class OverflowingRandom : public RandomSource {
public:
    int nextIndex(int bound) override { return bound; }
};

bool snakeContains(const SnakeCore& core, const Point& p) {
    const auto& body = core.getSnake();
    return std::find(body.begin(), body.end(), p) != body.end();
}

// Structural checks that hold after every tick
void expectConsistent(const SnakeCore& core, int initialLength) {
    const auto& body = core.getSnake();
    ASSERT_FALSE(body.empty());

    std::set<std::pair<int, int>> cells;
    for (const auto& p : body) {
        EXPECT_TRUE(p.x >= 0 && p.x < core.getWidth() && p.y >= 0 && p.y < core.getHeight())
            << "segment out of bounds at (" << p.x << "," << p.y << ")";
        cells.insert(std::make_pair(p.x, p.y));
    }
    EXPECT_EQ(cells.size(), body.size()) << "snake overlaps itself";
    EXPECT_EQ(static_cast<int>(body.size()), initialLength + core.getScore());

    if (core.hasFood()) {
        EXPECT_FALSE(snakeContains(core, core.getFood())) << "food on the snake";
    }
}

} // anonymous namespace

/* ===== Construction ===== */

TEST(SnakeCoreInitTest, StartsCenteredMovingRight) {
    SnakeCore core(10, 10, 42);

    EXPECT_EQ(core.state(), GameState::RUNNING);
    EXPECT_EQ(core.getLength(), 3u);
    EXPECT_EQ(core.getHead(), Point(5, 5));
    EXPECT_EQ(core.getSnake()[1], Point(4, 5));
    EXPECT_EQ(core.getSnake()[2], Point(3, 5));
    EXPECT_EQ(core.getDirection(), Direction::RIGHT);
    EXPECT_EQ(core.getScore(), 0);
    ASSERT_TRUE(core.hasFood());
    EXPECT_FALSE(snakeContains(core, core.getFood()));
}

TEST(SnakeCoreInitTest, MinimumGridIsAccepted) {
    SnakeCore core(4, 4, 1);
    EXPECT_EQ(core.getHead(), Point(2, 2));
    EXPECT_EQ(core.state(), GameState::RUNNING);
}

TEST(SnakeCoreInitTest, RejectsSmallGrids) {
    EXPECT_THROW(SnakeCore(3, 10, 1), InvalidConfig);
    EXPECT_THROW(SnakeCore(10, 3, 1), InvalidConfig);
    EXPECT_THROW(SnakeCore(0, 0, 1), InvalidConfig);
    EXPECT_THROW(SnakeCore(-5, 10, 1), InvalidConfig);
}

TEST(SnakeCoreInitTest, InvalidConfigIsAnInvalidArgument) {
    try {
        SnakeCore core(2, 2, 1);
        FAIL() << "expected InvalidConfig";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("2x2"), std::string::npos);
    }
}

TEST(SnakeCoreInitTest, RejectsLengthThatDoesNotFit) {
    EXPECT_THROW(makeCore(makeConfig(10, 10, 0)), InvalidConfig);
    EXPECT_THROW(makeCore(makeConfig(10, 10, 7)), InvalidConfig);
    EXPECT_NO_THROW(makeCore(makeConfig(10, 10, 6)));
}

TEST(SnakeCoreInitTest, RejectsMissingRandomSource) {
    EXPECT_THROW(SnakeCore(makeConfig(10, 10), nullptr), InvalidConfig);
}

TEST(SnakeCoreInitTest, FirstFoodComesFromRandomSource) {
    auto random = std::make_unique<ScriptedRandom>(std::initializer_list<int>{11});
    ScriptedRandom* script = random.get();
    SnakeCore core(makeConfig(10, 10), std::move(random));

    // 97 free cells, pick 11 in row-major order
    EXPECT_EQ(script->getLastBound(), 97);
    EXPECT_EQ(core.getFood(), Point(1, 1));
}

TEST(SnakeCoreInitTest, SameSeedSameGame) {
    SnakeCore a(12, 9, 2024);
    SnakeCore b(12, 9, 2024);

    for (int i = 0; i < 40 && !a.isTerminal(); i++) {
        Direction turn = (i % 7 == 3) ? Direction::DOWN : (i % 7 == 5 ? Direction::LEFT : Direction::UP);
        a.setDirection(turn);
        b.setDirection(turn);
        EXPECT_EQ(a.tick(), b.tick());
        EXPECT_EQ(a.getFood(), b.getFood());
        EXPECT_EQ(a.getHead(), b.getHead());
    }
}

/* ===== Movement ===== */

TEST(SnakeCoreMoveTest, TickMovesHeadOneCell) {
    auto core = makeCore(makeConfig(10, 10));

    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(6, 5));
    EXPECT_EQ(core->getLength(), 3u);
    EXPECT_EQ(core->getSnake().back(), Point(4, 5));
    EXPECT_EQ(core->getGrid().getTile(3, 5), TileContent::EMPTY);
    EXPECT_EQ(core->getGrid().getTile(6, 5), TileContent::SNAKE_HEAD);
    EXPECT_EQ(core->getGrid().getTile(5, 5), TileContent::SNAKE_BODY);
}

TEST(SnakeCoreMoveTest, UpDecreasesY) {
    auto core = makeCore(makeConfig(10, 10));
    core->setDirection(Direction::UP);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(5, 4));
    EXPECT_EQ(core->getDirection(), Direction::UP);
}

TEST(SnakeCoreMoveTest, ReversalIsIgnored) {
    auto core = makeCore(makeConfig(10, 10));
    core->setDirection(Direction::LEFT);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(6, 5));
    EXPECT_EQ(core->getDirection(), Direction::RIGHT);
}

TEST(SnakeCoreMoveTest, LastDirectionBeforeTickWins) {
    auto core = makeCore(makeConfig(10, 10));
    core->setDirection(Direction::UP);
    core->setDirection(Direction::DOWN);
    core->tick();
    EXPECT_EQ(core->getHead(), Point(5, 6));
}

TEST(SnakeCoreMoveTest, DoubleTurnCannotReverseIntoNeck) {
    auto core = makeCore(makeConfig(10, 10));
    // LEFT is judged against the last move (RIGHT), so UP stays buffered
    core->setDirection(Direction::UP);
    core->setDirection(Direction::LEFT);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(5, 4));

    core->setDirection(Direction::LEFT);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(4, 4));
}

TEST(SnakeCoreMoveTest, SameDirectionIsNoOp) {
    auto core = makeCore(makeConfig(10, 10));
    core->setDirection(Direction::RIGHT);
    core->tick();
    EXPECT_EQ(core->getHead(), Point(6, 5));
}

TEST(SnakeCoreMoveTest, SingleSegmentSnakeMoves) {
    auto core = makeCore(makeConfig(6, 6, 1));
    EXPECT_EQ(core->getLength(), 1u);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(4, 3));
    EXPECT_EQ(core->getLength(), 1u);
    EXPECT_EQ(core->getGrid().getTile(3, 3), TileContent::EMPTY);
}

/* ===== Food ===== */

TEST(SnakeCoreFoodTest, EatingGrowsAndScores) {
    auto core = makeCoreWithFood(makeConfig(10, 10), AHEAD_WHEN_RIGHT);
    ASSERT_EQ(core->getFood(), Point(6, 5));

    EXPECT_EQ(core->tick(), TickResult::ATE);
    EXPECT_EQ(core->getLength(), 4u);
    EXPECT_EQ(core->getScore(), 1);
    EXPECT_EQ(core->getHead(), Point(6, 5));
    EXPECT_EQ(core->getSnake().back(), Point(3, 5));
    ASSERT_TRUE(core->hasFood());
    EXPECT_FALSE(snakeContains(*core, core->getFood()));
}

TEST(SnakeCoreFoodTest, NewFoodPickedAmongFreeCells) {
    auto random = std::make_unique<ScriptedRandom>(std::initializer_list<int>{AHEAD_WHEN_RIGHT, 2});
    ScriptedRandom* script = random.get();
    SnakeCore core(makeConfig(10, 10), std::move(random));
    ASSERT_EQ(core.getFood(), Point(6, 5));

    EXPECT_EQ(core.tick(), TickResult::ATE);
    // 100 cells minus a 4-segment snake
    EXPECT_EQ(script->getLastBound(), 96);
    EXPECT_EQ(core.getFood(), Point(2, 0));
}

TEST(SnakeCoreFoodTest, EveryPickLandsOnADistinctFreeCell) {
    std::set<std::pair<int, int>> placed;
    for (int pick = 0; pick < 97; pick++) {
        auto core = makeCoreWithFood(makeConfig(10, 10), pick);
        const Point& food = core->getFood();

        ASSERT_TRUE(core->hasFood());
        EXPECT_TRUE(core->getGrid().isValidPosition(food));
        EXPECT_FALSE(snakeContains(*core, food)) << "pick " << pick;
        EXPECT_EQ(core->getGrid().getTile(food), TileContent::FOOD);
        placed.insert(std::make_pair(food.x, food.y));
    }
    // 100 cells minus the 3-segment snake, each reachable once
    EXPECT_EQ(placed.size(), 97u);
}

TEST(SnakeCoreFoodTest, OutOfRangePickIsReported) {
    EXPECT_THROW(SnakeCore(makeConfig(10, 10), std::make_unique<OverflowingRandom>()),
                 std::out_of_range);
}

/* ===== Collisions ===== */

TEST(SnakeCoreCollisionTest, WallEndsGame) {
    auto core = makeCore(makeConfig(10, 10, 3, Direction::LEFT));
    ASSERT_EQ(core->getHead(), Point(5, 5));

    for (int i = 0; i < 5; i++) {
        ASSERT_EQ(core->tick(), TickResult::MOVED);
    }
    ASSERT_EQ(core->getHead(), Point(0, 5));

    EXPECT_EQ(core->tick(), TickResult::LOST);
    EXPECT_EQ(core->state(), GameState::LOST);
    // The losing move is not applied
    EXPECT_EQ(core->getHead(), Point(0, 5));

    EXPECT_EQ(core->tick(), TickResult::TERMINAL);
    EXPECT_EQ(core->state(), GameState::LOST);
}

TEST(SnakeCoreCollisionTest, EveryWallIsDeadly) {
    const Direction directions[] = {Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT};
    for (Direction direction : directions) {
        auto core = makeCore(makeConfig(8, 8, 1, direction));
        TickResult result = TickResult::MOVED;
        int ticks = 0;
        while (result == TickResult::MOVED && ticks < 20) {
            result = core->tick();
            ticks++;
        }
        EXPECT_EQ(result, TickResult::LOST) << directionName(direction) << " ended with "
                                            << tickResultName(result);
    }
}

TEST(SnakeCoreCollisionTest, RunningIntoBodyEndsGame) {
    auto core = makeCore(makeConfig(10, 10, 5));

    core->setDirection(Direction::UP);
    ASSERT_EQ(core->tick(), TickResult::MOVED);
    core->setDirection(Direction::LEFT);
    ASSERT_EQ(core->tick(), TickResult::MOVED);
    core->setDirection(Direction::DOWN);

    EXPECT_EQ(core->tick(), TickResult::LOST);
    EXPECT_EQ(core->state(), GameState::LOST);
}

TEST(SnakeCoreCollisionTest, HeadMayFollowTail) {
    auto core = makeCore(makeConfig(10, 10, 4));

    core->setDirection(Direction::UP);
    ASSERT_EQ(core->tick(), TickResult::MOVED);
    core->setDirection(Direction::LEFT);
    ASSERT_EQ(core->tick(), TickResult::MOVED);
    ASSERT_EQ(core->getSnake().back(), Point(4, 5));

    core->setDirection(Direction::DOWN);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(4, 5));
    EXPECT_EQ(core->getLength(), 4u);
    EXPECT_EQ(core->getGrid().getTile(4, 5), TileContent::SNAKE_HEAD);
}

/* ===== Terminal states ===== */

TEST(SnakeCoreTerminalTest, InputIgnoredAfterLoss) {
    auto core = makeCore(makeConfig(4, 4, 1));
    core->tick();
    ASSERT_EQ(core->tick(), TickResult::LOST);

    CoreSnapshot before = core->snapshot();
    core->setDirection(Direction::UP);
    EXPECT_EQ(core->tick(), TickResult::TERMINAL);

    CoreSnapshot after = core->snapshot();
    EXPECT_EQ(after.direction, before.direction);
    EXPECT_EQ(after.snake, before.snake);
    EXPECT_EQ(after.score, before.score);
}

TEST(SnakeCoreTerminalTest, FillingTheGridWins) {
    // Hamiltonian cycle on 4x4 that contains the starting body (0,2)->(1,2)->(2,2)
    const std::vector<Point> cycle = {
        Point(0, 0), Point(1, 0), Point(2, 0), Point(3, 0),
        Point(3, 1), Point(3, 2), Point(3, 3), Point(2, 3),
        Point(1, 3), Point(0, 3), Point(0, 2), Point(1, 2),
        Point(2, 2), Point(2, 1), Point(1, 1), Point(0, 1),
    };

    SnakeCore core(4, 4, 7);
    ASSERT_EQ(core.getHead(), Point(2, 2));

    TickResult result = TickResult::MOVED;
    int ticks = 0;
    while (core.state() == GameState::RUNNING && ticks < 1000) {
        auto it = std::find(cycle.begin(), cycle.end(), core.getHead());
        ASSERT_NE(it, cycle.end());
        size_t index = static_cast<size_t>(it - cycle.begin());
        Point next = cycle[(index + 1) % cycle.size()];
        Point delta(next.x - core.getHead().x, next.y - core.getHead().y);

        if (delta == directionVector(Direction::UP)) core.setDirection(Direction::UP);
        else if (delta == directionVector(Direction::DOWN)) core.setDirection(Direction::DOWN);
        else if (delta == directionVector(Direction::LEFT)) core.setDirection(Direction::LEFT);
        else core.setDirection(Direction::RIGHT);

        result = core.tick();
        ASSERT_NE(result, TickResult::LOST) << "crashed after " << ticks << " ticks";
        ticks++;
    }

    EXPECT_EQ(result, TickResult::ATE);
    EXPECT_EQ(core.state(), GameState::WON);
    EXPECT_EQ(core.getLength(), 16u);
    EXPECT_EQ(core.getScore(), 13);
    EXPECT_FALSE(core.hasFood());
    EXPECT_EQ(core.getGrid().countFreeCells(), 0);
    EXPECT_EQ(core.tick(), TickResult::TERMINAL);
}

TEST(SnakeCoreTerminalTest, ResetStartsOver) {
    auto core = makeCoreWithFood(makeConfig(10, 10, 3, Direction::LEFT), AHEAD_WHEN_LEFT);
    ASSERT_EQ(core->getFood(), Point(4, 5));
    ASSERT_EQ(core->tick(), TickResult::ATE);
    while (core->tick() != TickResult::LOST) {}

    core->reset();
    EXPECT_EQ(core->state(), GameState::RUNNING);
    EXPECT_EQ(core->getScore(), 0);
    EXPECT_EQ(core->getLength(), 3u);
    EXPECT_EQ(core->getHead(), Point(5, 5));
    EXPECT_EQ(core->getDirection(), Direction::LEFT);
    EXPECT_EQ(core->tick(), TickResult::MOVED);
}

/* ===== Wrap-around ===== */

TEST(SnakeCoreWrapTest, LeavingLeftEdgeReentersRight) {
    auto core = makeCore(makeConfig(10, 10, 3, Direction::LEFT, true));
    for (int i = 0; i < 5; i++) {
        ASSERT_EQ(core->tick(), TickResult::MOVED);
    }
    ASSERT_EQ(core->getHead(), Point(0, 5));

    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(9, 5));
    EXPECT_EQ(core->state(), GameState::RUNNING);
}

TEST(SnakeCoreWrapTest, LeavingTopReentersBottom) {
    auto core = makeCore(makeConfig(6, 6, 1, Direction::UP, true));
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(core->tick(), TickResult::MOVED);
    }
    ASSERT_EQ(core->getHead(), Point(3, 0));
    EXPECT_EQ(core->tick(), TickResult::MOVED);
    EXPECT_EQ(core->getHead(), Point(3, 5));
}

/* ===== Snapshot ===== */

TEST(SnakeCoreSnapshotTest, MatchesLiveState) {
    auto core = makeCore(makeConfig(8, 6));
    core->setDirection(Direction::DOWN);
    core->tick();

    CoreSnapshot snap = core->snapshot();
    EXPECT_EQ(snap.width, 8);
    EXPECT_EQ(snap.height, 6);
    ASSERT_EQ(snap.snake.size(), core->getLength());
    EXPECT_EQ(snap.snake.front(), core->getHead());
    EXPECT_EQ(snap.food, core->getFood());
    EXPECT_EQ(snap.hasFood, core->hasFood());
    EXPECT_EQ(snap.direction, Direction::DOWN);
    EXPECT_EQ(snap.state, GameState::RUNNING);
    EXPECT_EQ(snap.score, 0);

    // Snapshot is a copy
    core->tick();
    EXPECT_NE(snap.snake.front(), core->getHead());
}

/* ===== Random play ===== */

TEST(SnakeCorePropertyTest, RandomPlayKeepsInvariants) {
    std::mt19937 inputs(99);
    std::uniform_int_distribution<int> pick(0, 4);
    const Direction directions[] = {Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT};

    for (uint32_t seed = 1; seed <= 25; seed++) {
        SnakeCore core(7 + seed % 5, 5 + seed % 4, seed);
        int length = static_cast<int>(core.getLength());

        for (int step = 0; step < 300; step++) {
            int choice = pick(inputs);
            if (choice < 4) core.setDirection(directions[choice]);

            int scoreBefore = core.getScore();
            TickResult result = core.tick();

            if (result == TickResult::ATE) {
                EXPECT_EQ(core.getScore(), scoreBefore + 1);
            } else {
                EXPECT_EQ(core.getScore(), scoreBefore);
            }
            if (result == TickResult::TERMINAL) {
                EXPECT_TRUE(core.isTerminal());
                break;
            }
            expectConsistent(core, length);
        }
    }
}
