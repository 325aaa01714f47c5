#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "termtris/core/GameState.hpp"
#include "termtris/core/Board.hpp"
#include "termtris/core/Tetromino.hpp"

using namespace termtris::core;

namespace {

Board boardWithFullRow(const GameState& game, int row) {
    Board b = game.createEmptyGrid();
    for (int c = 0; c < b.cols(); ++c) {
        b.setCell(row, c, 1);
    }
    return b;
}

} // namespace

TEST_CASE("createEmptyGrid returns rows x cols zeros", "[gamestate][grid]") {
    GameState game;
    const Board grid = game.createEmptyGrid();

    REQUIRE(grid.rows() == 20);
    REQUIRE(grid.cols() == 10);
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            REQUIRE(grid.cell(r, c) == EmptyCell);
        }
    }
}

TEST_CASE("GameState starts and spawns an active tetromino top-center", "[gamestate]") {
    GameState game{GameConfig{}, 42u};

    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE_FALSE(game.activeTetromino().has_value());

    game.start();

    REQUIRE(game.status() == GameStatus::Running);
    REQUIRE(game.activeTetromino().has_value());
    REQUIRE(game.nextTetromino().has_value());

    const int width = game.activeTetromino()->width();
    REQUIRE(game.position().row == 0);
    REQUIRE(game.position().col == (10 - width) / 2);
}

TEST_CASE("move_piece left then right returns to the start", "[gamestate][move]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{5, 0}));

    REQUIRE(game.movePiece(-1, 0));
    REQUIRE(game.position() == Position{4, 0});

    REQUIRE(game.movePiece(1, 0));
    REQUIRE(game.position() == Position{5, 0});
}

TEST_CASE("move_piece down advances one row", "[gamestate][move]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{5, 0}));

    REQUIRE(game.movePiece(0, 1));
    REQUIRE(game.position() == Position{5, 1});
}

TEST_CASE("move_piece into a wall fails and keeps the position", "[gamestate][move]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{0, 0}));

    REQUIRE_FALSE(game.movePiece(-1, 0));
    REQUIRE(game.position() == Position{0, 0});

    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{0, 18}));
    REQUIRE_FALSE(game.movePiece(0, 1));
    REQUIRE(game.position() == Position{0, 18});
}

TEST_CASE("move_piece never lifts a piece", "[gamestate][move]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{4, 5}));

    REQUIRE_FALSE(game.movePiece(0, -1));
    REQUIRE_FALSE(game.movePiece(1, -3));
    REQUIRE(game.position() == Position{4, 5});

    // Nothing can end up above the top edge, so locking keeps every cell
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{4, 0}));
    REQUIRE_FALSE(game.movePiece(0, -1));
    game.lockPiece();
    REQUIRE(game.board().cell(0, 4) == fillValueFor(TetrominoType::O));
    REQUIRE(game.board().cell(1, 5) == fillValueFor(TetrominoType::O));
}

TEST_CASE("checkCollision works on arbitrary pieces", "[gamestate][collision]") {
    GameState game;
    game.setBoard(boardWithFullRow(game, 0));

    const Tetromino square{Tetromino::Matrix{{1, 1}, {1, 1}}};
    REQUIRE(game.checkCollision(square, Position{0, 0}));
    REQUIRE_FALSE(game.checkCollision(square, Position{1, 1}));
}

TEST_CASE("rotatePiece commits a free rotation", "[gamestate][rotation]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::T}, Position{4, 5}));

    REQUIRE(game.rotatePiece());
    REQUIRE(game.activeTetromino()->height() == 3);
    REQUIRE(game.activeTetromino()->width() == 2);
}

TEST_CASE("rotatePiece refuses a rotation through the floor", "[gamestate][rotation]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::I}, Position{3, 19}));
    const auto before = game.activeTetromino()->shape();

    REQUIRE_FALSE(game.rotatePiece());
    REQUIRE(game.activeTetromino()->shape() == before);
    REQUIRE(game.position() == Position{3, 19});
}

TEST_CASE("rotatePiece refuses a rotation onto filled cells", "[gamestate][rotation]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::I}, Position{3, 5}));
    const auto before = game.activeTetromino()->shape();

    // Either rotation stands the I up in column 3, rows 5..8
    Board b = game.createEmptyGrid();
    b.setCell(7, 3, 1);
    game.setBoard(b);

    REQUIRE_FALSE(game.rotatePiece(true));
    REQUIRE_FALSE(game.rotatePiece(false));
    REQUIRE(game.activeTetromino()->shape() == before);
}

TEST_CASE("lockPiece writes the active piece into the grid", "[gamestate][lock]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{4, 18}));

    game.lockPiece();

    const auto fill = fillValueFor(TetrominoType::O);
    REQUIRE(game.board().cell(18, 4) == fill);
    REQUIRE(game.board().cell(18, 5) == fill);
    REQUIRE(game.board().cell(19, 4) == fill);
    REQUIRE(game.board().cell(19, 5) == fill);
    REQUIRE_FALSE(game.activeTetromino().has_value());
    REQUIRE(game.lockedPieces() == 1);
}

TEST_CASE("clearLines with one full row scores exactly one", "[gamestate][lines]") {
    GameState game;
    Board b = boardWithFullRow(game, 19);
    b.setCell(18, 2, 4);
    game.setBoard(b);

    REQUIRE(game.clearLines() == 1);
    REQUIRE(game.score() == 1);
    REQUIRE(game.board().cell(19, 2) == 4);
    for (int c = 0; c < 10; ++c) {
        REQUIRE(game.board().cell(0, c) == EmptyCell);
    }
}

TEST_CASE("clearLines with no full row leaves the score alone", "[gamestate][lines]") {
    GameState game;
    REQUIRE(game.clearLines() == 0);
    REQUIRE(game.score() == 0);
}

TEST_CASE("clearLines scores one point per row, no bonus", "[gamestate][lines]") {
    GameState game;
    Board b = boardWithFullRow(game, 19);
    for (int c = 0; c < 10; ++c) {
        b.setCell(18, c, 2);
        b.setCell(17, c, 3);
    }
    game.setBoard(b);

    REQUIRE(game.clearLines() == 3);
    REQUIRE(game.score() == 3);
    REQUIRE(game.board().isEmpty());
}

TEST_CASE("Speed gets faster once the score crosses a threshold", "[gamestate][speed]") {
    GameState game;
    const int initial = game.speed();

    for (int i = 0; i < 10; ++i) {
        game.setBoard(boardWithFullRow(game, 19));
        REQUIRE(game.clearLines() == 1);
    }

    REQUIRE(game.score() == 10);
    REQUIRE(game.speed() < initial);
    REQUIRE(game.level() == 1);
}

TEST_CASE("spawnPiece on a blocked spawn area ends the game", "[gamestate][spawn]") {
    GameState game;
    Board b = game.createEmptyGrid();
    for (int c = 0; c < 10; ++c) {
        b.setCell(0, c, 1);
        b.setCell(1, c, 1);
    }
    // Keep a gap so neither row counts as full
    b.setCell(0, 0, EmptyCell);
    b.setCell(1, 0, EmptyCell);
    game.setBoard(b);

    REQUIRE_FALSE(game.spawnPiece());
    REQUIRE(game.status() == GameStatus::GameOver);
    REQUIRE_FALSE(game.activeTetromino().has_value());
}

TEST_CASE("setBoard rejects a grid of the wrong size", "[gamestate]") {
    GameState game;
    REQUIRE_THROWS_AS(game.setBoard(Board(10, 10)), std::invalid_argument);
}

TEST_CASE("placeActive refuses a colliding placement", "[gamestate]") {
    GameState game;
    game.setBoard(boardWithFullRow(game, 0));

    REQUIRE_FALSE(game.placeActive(Tetromino{TetrominoType::O}, Position{0, 0}));
    REQUIRE_FALSE(game.activeTetromino().has_value());
}

TEST_CASE("tick moves the piece down, then locks and spawns", "[gamestate][tick]") {
    GameState game{GameConfig{}, 7u};
    game.start();
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{4, 17}));

    REQUIRE(game.tick());
    REQUIRE(game.position() == Position{4, 18});

    // Resting on the floor: this tick locks
    REQUIRE_FALSE(game.tick());
    REQUIRE(game.board().cell(19, 4) == fillValueFor(TetrominoType::O));
    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.activeTetromino().has_value());
    REQUIRE(game.position().row == 0);
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("hardDrop locks at the bottom and clears the completed line", "[gamestate][drop]") {
    GameState game{GameConfig{}, 7u};
    game.start();

    Board b = game.createEmptyGrid();
    for (int c = 0; c < 10; ++c) {
        if (c < 3 || c > 6) b.setCell(19, c, 1);
    }
    game.setBoard(b);
    REQUIRE(game.placeActive(Tetromino{TetrominoType::I}, Position{3, 0}));

    game.hardDrop();

    REQUIRE(game.score() == 1);
    REQUIRE(game.board().isEmpty());
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("Player actions are ignored unless running", "[gamestate]") {
    GameState game;
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, Position{5, 0}));

    REQUIRE_FALSE(game.moveLeft());
    REQUIRE_FALSE(game.softDrop());
    REQUIRE_FALSE(game.rotateClockwise());
    REQUIRE(game.position() == Position{5, 0});

    game.start();
    game.pause();
    REQUIRE(game.status() == GameStatus::Paused);
    const auto before = game.position();
    REQUIRE_FALSE(game.moveRight());
    REQUIRE_FALSE(game.tick());
    REQUIRE(game.position() == before);

    game.resume();
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("GameState reset clears score and status", "[gamestate]") {
    GameState game;
    game.setBoard(boardWithFullRow(game, 19));
    game.clearLines();
    game.start();

    game.reset();
    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE(game.score() == 0);
    REQUIRE(game.board().isEmpty());
    REQUIRE_FALSE(game.activeTetromino().has_value());
}

TEST_CASE("A long random game stays consistent", "[gamestate][tick]") {
    GameState game{GameConfig{}, 2024u};
    game.start();

    for (int i = 0; i < 2000 && game.status() == GameStatus::Running; ++i) {
        game.tick();
    }

    // Without input pieces stack in the middle until spawning fails
    REQUIRE(game.status() == GameStatus::GameOver);
    REQUIRE(game.lockedPieces() > 0);
}
