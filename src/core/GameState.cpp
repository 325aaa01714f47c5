#include "termtris/core/GameState.hpp"
#include "termtris/core/SpeedPolicy.hpp"

#include <stdexcept>
#include <utility>

namespace termtris::core {

GameState::GameState(GameConfig config)
    : config_{std::move(config)}
    , board_{config_.rows, config_.cols}
    , factory_{}
    , scoreManager_{}
    , activeTetromino_{}
    , nextTetromino_{}
    , status_{GameStatus::NotStarted}
{
}

GameState::GameState(GameConfig config, std::uint32_t seed)
    : config_{std::move(config)}
    , board_{config_.rows, config_.cols}
    , factory_{seed}
    , scoreManager_{}
    , activeTetromino_{}
    , nextTetromino_{}
    , status_{GameStatus::NotStarted}
{
}

int GameState::level() const noexcept {
    return levelForScore(scoreManager_.score(), config_);
}

int GameState::speed() const noexcept {
    return speedForScore(scoreManager_.score(), config_);
}

Board GameState::createEmptyGrid() const {
    return Board{config_.rows, config_.cols};
}

void GameState::start() {
    if (status_ == GameStatus::Running) return;

    scoreManager_.reset();
    board_ = createEmptyGrid();
    lockedPieces_ = 0;

    activeTetromino_.reset();
    nextTetromino_.reset();

    status_ = GameStatus::Running;

    spawnPiece(); // enters GameOver on failure
}

void GameState::pause() {
    if (status_ == GameStatus::Running) {
        status_ = GameStatus::Paused;
    }
}

void GameState::resume() {
    if (status_ == GameStatus::Paused) {
        status_ = GameStatus::Running;
    }
}

void GameState::reset() {
    scoreManager_.reset();
    board_ = createEmptyGrid();
    lockedPieces_ = 0;
    activeTetromino_.reset();
    nextTetromino_.reset();
    position_ = Position{};
    status_ = GameStatus::NotStarted;
}

bool GameState::tick() {
    if (status_ != GameStatus::Running) {
        return false;
    }

    if (!activeTetromino_) {
        spawnPiece();
        return false;
    }

    // Try move down by 1
    if (movePiece(0, 1)) {
        return true;
    }

    // Cannot move down => lock piece and spawn a new one
    lockAndSpawnNext();
    return false;
}

bool GameState::moveLeft() {
    if (!isPlaying()) return false;
    return movePiece(-1, 0);
}

bool GameState::moveRight() {
    if (!isPlaying()) return false;
    return movePiece(1, 0);
}

bool GameState::softDrop() {
    if (!isPlaying()) return false;
    return movePiece(0, 1);
}

void GameState::hardDrop() {
    if (!isPlaying()) return;

    // Drop until we can't move further
    while (movePiece(0, 1)) {
    }

    lockAndSpawnNext();
}

bool GameState::rotateClockwise() {
    if (!isPlaying()) return false;
    return rotatePiece(true);
}

bool GameState::rotateCounterClockwise() {
    if (!isPlaying()) return false;
    return rotatePiece(false);
}

Position GameState::spawnPositionFor(const Tetromino& piece) const noexcept {
    return Position{(board_.cols() - piece.width()) / 2, 0};
}

bool GameState::spawnPiece() {
    if (!nextTetromino_) {
        nextTetromino_ = factory_.createRandom();
    }

    activeTetromino_ = std::move(nextTetromino_);
    nextTetromino_ = factory_.createRandom();
    position_ = spawnPositionFor(*activeTetromino_);

    if (board_.collides(*activeTetromino_, position_)) {
        // Cannot spawn -> game over
        activeTetromino_.reset();
        status_ = GameStatus::GameOver;
        return false;
    }
    return true;
}

bool GameState::movePiece(int dCol, int dRow) {
    // Pieces only ever fall; lifting one could park cells above the grid
    if (!activeTetromino_ || dRow < 0) return false;

    const Position moved{position_.col + dCol, position_.row + dRow};
    if (board_.collides(*activeTetromino_, moved)) {
        return false;
    }
    position_ = moved;
    return true;
}

void GameState::lockPiece() {
    if (!activeTetromino_) return;

    board_.lockTetromino(*activeTetromino_, position_);
    activeTetromino_.reset();
    ++lockedPieces_;
}

int GameState::clearLines() {
    const int lines = board_.clearFullLines();
    scoreManager_.addLinesCleared(lines);
    return lines;
}

void GameState::setBoard(Board board) {
    if (board.rows() != config_.rows || board.cols() != config_.cols) {
        throw std::invalid_argument("GameState::setBoard dimension mismatch");
    }
    board_ = std::move(board);
}

bool GameState::placeActive(Tetromino piece, Position origin) {
    if (board_.collides(piece, origin)) {
        return false;
    }
    activeTetromino_ = std::move(piece);
    position_ = origin;
    return true;
}

void GameState::lockAndSpawnNext() {
    lockPiece();
    clearLines();
    spawnPiece();
}

bool GameState::rotatePiece(bool clockwise) {
    if (!activeTetromino_) return false;

    Tetromino rotated = *activeTetromino_;
    if (clockwise) {
        rotated.rotateClockwise();
    } else {
        rotated.rotateCounterClockwise();
    }

    if (board_.collides(rotated, position_)) {
        // No wall kicks: a blocked rotation leaves the piece as it was
        return false;
    }
    activeTetromino_ = std::move(rotated);
    return true;
}

} // namespace termtris::core
