#ifndef CELL_HPP
#define CELL_HPP

// Board coordinate. Ordered row-major so it can key std::set.
struct Cell {
    int row, col;
    Cell() : row(-1), col(-1) {}
    Cell(int row, int col) : row(row), col(col) {}

    bool operator==(const Cell& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Cell& other) const { return !(*this == other); }
    bool operator<(const Cell& other) const {
        return row != other.row ? row < other.row : col < other.col;
    }
};

#endif // CELL_HPP
