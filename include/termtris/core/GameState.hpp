#pragma once

#include "Board.hpp"
#include "GameConfig.hpp"
#include "Tetromino.hpp"
#include "TetrominoFactory.hpp"
#include "ScoreManager.hpp"
#include <cstdint>
#include <optional>

namespace termtris::core {

enum class GameStatus {
    NotStarted,
    Running,
    Paused,
    GameOver
};

class GameState {
public:
    explicit GameState(GameConfig config = GameConfig{});
    GameState(GameConfig config, std::uint32_t seed);

    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<Tetromino>& activeTetromino() const noexcept { return activeTetromino_; }
    const std::optional<Tetromino>& nextTetromino() const noexcept { return nextTetromino_; }
    Position position() const noexcept { return position_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    std::uint64_t linesCleared() const noexcept { return scoreManager_.linesCleared(); }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }
    int level() const noexcept;
    GameStatus status() const noexcept { return status_; }

    // Gravity interval in ms for the current score
    int speed() const noexcept;

    // A fresh grid with this game's dimensions, every cell empty
    Board createEmptyGrid() const;

    // Control API for the controller / input layer
    void start();
    void pause();
    void resume();
    void reset();

    // One gravity step (called periodically at speed() intervals).
    // Returns true if the piece moved down; false if it locked or could not move.
    bool tick();

    // Player actions. Each returns whether the piece actually changed.
    bool moveLeft();
    bool moveRight();
    bool softDrop();
    void hardDrop(); // drop to the bottom and lock

    bool rotateClockwise();
    bool rotateCounterClockwise();

    // Core operations, usable without start() for setups and tests

    // Take the queued piece, place it top-center and queue the next one.
    // Returns false (and enters GameOver) if the spawn spot is blocked.
    bool spawnPiece();

    // Shift the active piece by (dCol, dRow) unless that collides.
    // Upward moves (dRow < 0) are always refused.
    bool movePiece(int dCol, int dRow);

    // Rotate the active piece in place by 90 degrees; a rotation that would
    // collide is refused and the piece is left unchanged
    bool rotatePiece(bool clockwise = true);

    bool checkCollision(const Tetromino& piece, Position origin) const noexcept {
        return board_.collides(piece, origin);
    }

    // Write the active piece into the grid and drop it
    void lockPiece();

    // Remove full rows; score grows by the number removed
    int clearLines();

    // Replace the grid. Throws std::invalid_argument on a size mismatch.
    void setBoard(Board board);

    // Install a specific active piece; refused if it would collide
    bool placeActive(Tetromino piece, Position origin);

private:
    GameConfig config_;
    Board board_;
    TetrominoFactory factory_;
    ScoreManager scoreManager_;

    std::optional<Tetromino> activeTetromino_;
    std::optional<Tetromino> nextTetromino_;
    Position position_{};

    std::uint64_t lockedPieces_{0};
    GameStatus status_{GameStatus::NotStarted};

    bool isPlaying() const noexcept {
        return status_ == GameStatus::Running && activeTetromino_.has_value();
    }

    Position spawnPositionFor(const Tetromino& piece) const noexcept;
    void lockAndSpawnNext();
};

} // namespace termtris::core
