#include <gtest/gtest.h>
#include <QApplication>

// Widget tests run headless on the offscreen platform plugin
int main(int argc, char** argv) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
