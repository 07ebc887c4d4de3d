#include <gtest/gtest.h>
#include <QCoreApplication>





/** The tests need a QCoreApplication alive, for the sockets, timers and queued signals. */
int main(int argc, char * argv[])
{
	QCoreApplication app(argc, argv);
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
