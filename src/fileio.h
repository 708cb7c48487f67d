#ifndef FILEIO_H_
#define FILEIO_H_

#include "actypes.h"
#include "actemplates.h"

#include <cerrno>

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <string.h>

extern "C"
{
struct event;
}

namespace dlbr
{

class Cstat
{
	bool bResult = false;
	struct stat data;
public:
	Cstat() { memset(&data, 0, sizeof(data)); };
	Cstat(const char *sz) : Cstat() { update(sz); }
	Cstat(cmstring &s) : Cstat(s.c_str()) {}
	Cstat(int fd) : Cstat()
	{
		bResult = ! fstat(fd, &data);
	}
	operator bool() const { return bResult; }
	const struct stat& info() { return data; }
	bool update(const char *sz) { return (bResult = ! stat(sz, &data)); }
	off_t size() { return data.st_size; }

	// identifies a particular version of a file, changes on replacement and on modification
	struct tID
	{
		struct timespec a;
		dev_t b;
		ino_t c;
		off_t d;
		bool operator==(const tID& B) const { return b == B.b && c == B.c && d == B.d && a.tv_nsec == B.a.tv_nsec && a.tv_sec == B.a.tv_sec; }
		bool operator!=(const tID& B) const { return !(*this == B); }
	};
	tID fpr() { return { data.st_mtim, data.st_dev, data.st_ino, data.st_size }; }
};

inline void justforceclose(int fd)
{
	while(0 != ::close(fd))
	{
		if(errno != EINTR)
			break;
	};
}

inline void checkforceclose(int &fd)
{
	while (fd != -1)
	{
		if (0 == ::close(fd) || errno != EINTR)
			fd = -1;
	}
}

//! Create the directory and all missing parents, false on failure (errno is kept)
bool mkdirhier(cmstring& path);
//! Create the parent directories of a file path
bool mkbasedir(cmstring& path);

//! Write all or fail, -1 with errno on errors
ssize_t dumpall(int fd, string_view data);

/**
 * @brief Replace the file contents safely, via a temporary file and rename.
 * @return Empty string on success, error description otherwise
 */
mstring ReplaceFileContents(cmstring& path, string_view data);

using unique_fd = auto_raii<int, justforceclose, -1>;

void event_and_fd_free(event*);
using unique_fdevent = auto_raii<event*, event_and_fd_free, nullptr>;

}

#endif /* FILEIO_H_ */
