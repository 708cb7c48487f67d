#include "fileio.h"
#include "meta.h"
#include "debug.h"

#include <fcntl.h>
#include <unistd.h>

#include <event2/event.h>

using namespace std;

namespace dlbr
{

static bool optmkdir(LPCSTR path)
{
	return 0 == mkdir(path, 0755) || EEXIST == errno;
}

bool mkdirhier(cmstring& path)
{
	// optimistic, should succeed in most cases
	if (optmkdir(path.c_str()))
		return true;

	mstring work(path);
	auto it = work.begin();
	while (it < work.end() && *it == '/')
		++it;
	// punch terminators into the string to mkdir on each level
	for (;it < work.end(); ++it)
	{
		if (*it != '/')
			continue;
		*it = 0x0;
		if (!optmkdir(work.data()))
			return false;
		*it = '/';
	}
	return optmkdir(work.c_str());
}

bool mkbasedir(cmstring& path)
{
	auto pos = path.rfind('/');
	if (pos == stmiss || pos == 0)
		return true;
	return mkdirhier(path.substr(0, pos));
}

ssize_t dumpall(int fd, string_view data)
{
	ssize_t ret = data.size();
	while (data.size())
	{
		errno = 0;
		auto n = ::write(fd, data.data(), data.size());
		if (n <= 0)
		{
			if (errno == EINTR || errno == EAGAIN)
				continue;
			return -1;
		}
		data.remove_prefix(n);
	}
	return ret;
}

mstring ReplaceFileContents(cmstring &path, string_view data)
{
	LOGSTARTFUNCxs(path);
	auto tmpPath = path + ".tmp." + ltos(getpid());
	mkbasedir(path);
	unique_fd fd(open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
	if (!fd.valid())
		return tErrnoFmter("Cannot create " + tmpPath + ": ");
	if (dumpall(fd.get(), data) < 0 || 0 != fsync(fd.get()))
	{
		tErrnoFmter err("Cannot write " + tmpPath + ": ");
		unlink(tmpPath.c_str());
		return err;
	}
	fd.reset();
	if (0 != rename(tmpPath.c_str(), path.c_str()))
	{
		tErrnoFmter err("Cannot replace " + path + ": ");
		unlink(tmpPath.c_str());
		return err;
	}
	return se;
}

void event_and_fd_free(event *e)
{
	if (!e)
		return;
	auto fd = event_get_fd(e);
	event_free(e);
	checkforceclose(fd);
}

}
