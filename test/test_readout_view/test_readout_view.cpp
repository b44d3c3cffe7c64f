#include <unity.h>

#include <QApplication>

#include "window/readout_view.h"

using namespace sevenseg;

void setUp(void) {}
void tearDown(void) {}

void test_size_follows_text(void) {
	const Style style;
	ReadoutView view(style, "8");
	TEST_ASSERT_TRUE(view.sizeHint() == QSize(36, 64));
	TEST_ASSERT_TRUE(view.minimumSize() == QSize(9, 16));

	view.setText("8888");
	TEST_ASSERT_EQUAL_UINT32(4, view.getReadout().size());
	TEST_ASSERT_TRUE(view.sizeHint() == QSize(144, 64));
	TEST_ASSERT_TRUE(view.minimumSize() == QSize(36, 16));

	view.setText("8");
	TEST_ASSERT_TRUE(view.minimumSize() == QSize(9, 16));
}

void test_size_follows_style(void) {
	ReadoutView view(Style(), "12");

	Style tall;
	tall.height = 128;
	tall.skew = Skew::traditional();
	view.setReadoutStyle(tall);
	TEST_ASSERT_TRUE(view.sizeHint() == QSize(144, 128));
	TEST_ASSERT_TRUE(view.minimumSize() == QSize(36, 32));
	TEST_ASSERT_TRUE(view.getReadout().skew() == Skew::traditional());
	TEST_ASSERT_EQUAL_UINT32(2, view.getReadout().size());
}

int main(int argc, char** argv) {
	if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
		qputenv("QT_QPA_PLATFORM", "offscreen");
	QApplication app(argc, argv);

	UNITY_BEGIN();
	RUN_TEST(test_size_follows_text);
	RUN_TEST(test_size_follows_style);
	return UNITY_END();
}
