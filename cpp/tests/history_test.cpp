#include <gtest/gtest.h>

#include "canvas/history/history_manager.h"

#include <vector>

using namespace canvas;

namespace {

Command pushValue(std::vector<int>& values, int value) {
    Command cmd;
    cmd.description = "Push " + std::to_string(value);
    cmd.execute = [&values, value]() { values.push_back(value); };
    cmd.undo = [&values]() { values.pop_back(); };
    return cmd;
}

} // namespace

TEST(HistoryTest, UndoRedoSequence) {
    std::vector<int> values;
    HistoryManager history;

    ASSERT_TRUE(history.execute(pushValue(values, 1)));
    ASSERT_TRUE(history.execute(pushValue(values, 2)));
    EXPECT_EQ(values, (std::vector<int>{1, 2}));
    EXPECT_EQ(history.undoDescription(), "Push 2");

    EXPECT_TRUE(history.undo());
    EXPECT_EQ(values, (std::vector<int>{1}));
    EXPECT_EQ(history.redoDescription(), "Push 2");

    EXPECT_TRUE(history.undo());
    EXPECT_TRUE(values.empty());
    EXPECT_FALSE(history.undo());

    EXPECT_TRUE(history.redo());
    EXPECT_TRUE(history.redo());
    EXPECT_EQ(values, (std::vector<int>{1, 2}));
    EXPECT_FALSE(history.redo());
    EXPECT_TRUE(history.redoDescription().empty());
}

TEST(HistoryTest, ExecuteDiscardsRedoBranch) {
    std::vector<int> values;
    HistoryManager history;

    history.execute(pushValue(values, 1));
    history.execute(pushValue(values, 2));
    history.undo();
    ASSERT_TRUE(history.canRedo());

    history.execute(pushValue(values, 3));
    EXPECT_FALSE(history.canRedo());
    EXPECT_EQ(values, (std::vector<int>{1, 3}));
}

TEST(HistoryTest, DepthBoundDropsOldestEntries) {
    std::vector<int> values;
    HistoryManager history(2);

    for (int i = 0; i < 5; ++i) {
        history.execute(pushValue(values, i));
    }
    EXPECT_EQ(history.getUndoSize(), 2u);

    history.undo();
    history.undo();
    EXPECT_FALSE(history.undo());
    EXPECT_EQ(values, (std::vector<int>{0, 1, 2}));

    history.setMaxDepth(0);
    EXPECT_EQ(history.getMaxDepth(), 0u);
}

TEST(HistoryTest, RejectsIncompleteCommands) {
    HistoryManager history;
    bool ran = false;

    Command noUndo;
    noUndo.description = "half";
    noUndo.execute = [&ran]() { ran = true; };
    EXPECT_FALSE(history.execute(noUndo));
    EXPECT_FALSE(ran);
    EXPECT_FALSE(history.canUndo());
    EXPECT_EQ(history.getGeneration(), 0u);
}

TEST(HistoryTest, GenerationAdvancesOnEveryTransition) {
    std::vector<int> values;
    HistoryManager history;

    history.execute(pushValue(values, 1));
    const auto afterExecute = history.getGeneration();
    history.undo();
    EXPECT_GT(history.getGeneration(), afterExecute);
    const auto afterUndo = history.getGeneration();
    history.redo();
    EXPECT_GT(history.getGeneration(), afterUndo);

    history.clear();
    EXPECT_FALSE(history.canUndo());
    EXPECT_FALSE(history.canRedo());
}
