#include "gtest/gtest.h"
#include "sgcfg.h"

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

using namespace sgate;
using namespace std;

namespace
{
// restores the settings touched by a test
struct tCfgBackup
{
	mstring bottoken = cfg::bottoken, workertokens = cfg::workertokens, logchannel = cfg::logchannel,
			statedir = cfg::statedir, gatewayurl = cfg::gatewayurl;
	int port = cfg::port, chunksize = cfg::chunksize, linkexpiry = cfg::linkexpiry,
			maxreqsperip = cfg::maxreqsperip;
	~tCfgBackup()
	{
		cfg::bottoken = bottoken;
		cfg::workertokens = workertokens;
		cfg::logchannel = logchannel;
		cfg::statedir = statedir;
		cfg::gatewayurl = gatewayurl;
		cfg::port = port;
		cfg::chunksize = chunksize;
		cfg::linkexpiry = linkexpiry;
		cfg::maxreqsperip = maxreqsperip;
		cfg::PostProcConfig();
	}
};
}

TEST(config, set_option)
{
	tCfgBackup bak;
	EXPECT_TRUE(cfg::SetOption("Port: 9999", true));
	EXPECT_EQ(9999, cfg::port);
	EXPECT_TRUE(cfg::SetOption("port=8123", true));
	EXPECT_EQ(8123, cfg::port);
	EXPECT_TRUE(cfg::SetOption("  BotToken   =  123:abc ", true));
	EXPECT_EQ("123:abc", cfg::bottoken);
	// the value may contain separators itself
	EXPECT_TRUE(cfg::SetOption("GatewayUrl: http://localhost:8081/x", true));
	EXPECT_EQ("http://localhost:8081/x", cfg::gatewayurl);

	EXPECT_FALSE(cfg::SetOption("NoSuchThing: 1", true));
	EXPECT_FALSE(cfg::SetOption("just words", true));
	EXPECT_FALSE(cfg::SetOption("Port: eighty", true));
	EXPECT_FALSE(cfg::SetOption("MaxRequestsPerIP: -1", true));
	EXPECT_FALSE(cfg::SetOption("ChunkSize: 100", true));
	EXPECT_EQ(8123, cfg::port);

	// deprecated alias
	EXPECT_TRUE(cfg::SetOption("MaxLinkAge: 77", true));
	EXPECT_EQ(77, cfg::linkexpiry);
}

TEST(config, postproc)
{
	tCfgBackup bak;
	cfg::bottoken = "1:a";
	cfg::logchannel = "-1001234567";
	cfg::workertokens = "2:b, 3:c\t4:d";
	cfg::statedir = "/tmp/sgstate";
	cfg::chunksize = 512 * 1024;
	EXPECT_EQ("", cfg::PostProcConfig());
	EXPECT_EQ(-1001234567, cfg::channelId);
	ASSERT_EQ(3u, cfg::workerTokenList.size());
	EXPECT_EQ("2:b", cfg::workerTokenList[0]);
	EXPECT_EQ("4:d", cfg::workerTokenList[2]);
	EXPECT_EQ("/tmp/sgstate/", cfg::statedir);

	cfg::workertokens.clear();
	EXPECT_EQ("", cfg::PostProcConfig());
	EXPECT_TRUE(cfg::workerTokenList.empty());

	cfg::logchannel = "channel";
	EXPECT_NE("", cfg::PostProcConfig());
	cfg::logchannel = "5";

	cfg::chunksize = 3 * 4096;
	EXPECT_NE("", cfg::PostProcConfig());
	cfg::chunksize = 4096;

	cfg::bottoken.clear();
	EXPECT_NE("", cfg::PostProcConfig());
}

TEST(config, read_file)
{
	tCfgBackup bak;
	char tmpl[] = "/tmp/sgcfgXXXXXX";
	int fd = mkstemp(tmpl);
	ASSERT_GE(fd, 0);
	close(fd);
	{
		ofstream out(tmpl);
		out << "# sample\n"
			<< "\n"
			<< "Port: 7001   # inline comment\n"
			<< "   BotToken = 9:zz\n"
			<< "MaxRequestsPerIP: 3\n";
	}
	EXPECT_TRUE(cfg::ReadConfigFile(tmpl, false));
	EXPECT_EQ(7001, cfg::port);
	EXPECT_EQ("9:zz", cfg::bottoken);
	EXPECT_EQ(3, cfg::maxreqsperip);

	{
		ofstream out(tmpl);
		out << "Port: 7002\n"
			<< "Bogus line\n";
	}
	EXPECT_FALSE(cfg::ReadConfigFile(tmpl, false));
	// valid lines are still applied
	EXPECT_EQ(7002, cfg::port);

	unlink(tmpl);
	EXPECT_FALSE(cfg::ReadConfigFile(tmpl, false));
}

TEST(config, dump_hides_secrets)
{
	tCfgBackup bak;
	cfg::bottoken = "12345:secret";
	stringstream ss;
	cfg::dump_config(ss);
	auto s = ss.str();
	EXPECT_EQ(mstring::npos, s.find("secret"));
	EXPECT_NE(mstring::npos, s.find("BotToken = (set)"));
	EXPECT_NE(mstring::npos, s.find("Port = "));
	EXPECT_EQ(mstring::npos, s.find("MaxLinkAge"));
}
