#pragma once

int cmd_duplicates(int argc, char** argv);
